/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

// Combines several lambdas into one visitor for std::visit.
template<typename... Ts>
struct overloaded_functor : Ts... {
    using Ts::operator()...;
};

template<typename... Ts> overloaded_functor(Ts...) -> overloaded_functor<Ts...>;
