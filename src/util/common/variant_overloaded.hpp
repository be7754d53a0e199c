// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_UTIL_COMMON_VARIANT_OVERLOADED_H_
#define AGENTPAY_SRC_UTIL_COMMON_VARIANT_OVERLOADED_H_

namespace agentpay {
    /// Combines a set of lambdas into a single visitor for std::visit.
    template<class... Ts>
    struct overloaded : Ts... {
        using Ts::operator()...;
    };
    template<class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;
}

#endif
