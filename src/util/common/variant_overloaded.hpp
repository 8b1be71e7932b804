// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARDX_SRC_COMMON_VARIANT_OVERLOADED_H_
#define SHARDX_SRC_COMMON_VARIANT_OVERLOADED_H_

namespace shardx {
    /// Helper for std::visit which builds a visitor from a set of lambdas.
    template<class... Ts>
    struct overloaded : Ts... {
        using Ts::operator()...;
    };

    template<class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;
}

#endif
