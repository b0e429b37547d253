/*
   Copyright 2023 The Blockgate Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#ifndef BLOCKGATE_CONFIG_HPP_
#define BLOCKGATE_CONFIG_HPP_

// Boost.Asio awaitable.hpp uses std::exchange without including <utility>
#include <utility>

#include <boost/asio/detail/config.hpp>

// Every request path is written as a chain of co_await on Asio awaitables
#if !defined(BOOST_ASIO_HAS_CO_AWAIT)
#error "Blockgate requires C++20 coroutine support in Boost.Asio (BOOST_ASIO_HAS_CO_AWAIT)"
#endif

#endif // BLOCKGATE_CONFIG_HPP_
