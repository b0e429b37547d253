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

#ifndef BLOCKGATE_CONCURRENCY_CONTEXT_POOL_HPP_
#define BLOCKGATE_CONCURRENCY_CONTEXT_POOL_HPP_

#include <cstddef>
#include <functional>
#include <iostream>
#include <memory>
#include <vector>

#include <blockgate/config.hpp>

#include <boost/asio/detail/thread_group.hpp>
#include <boost/asio/execution.hpp>
#include <boost/asio/io_context.hpp>

#include <blockgate/node/client.hpp>

namespace blockgate {

using ClientFactory = std::function<std::unique_ptr<node::Client>(boost::asio::io_context&)>;

//! Asynchronous scheduler running an execution loop together with the node client bound to it.
class Context {
  public:
    explicit Context(const ClientFactory& create_client);

    boost::asio::io_context* io_context() const noexcept { return io_context_.get(); }
    std::unique_ptr<node::Client>& node_client() noexcept { return node_client_; }

    //! Execute the scheduler loop until stopped.
    void execute_loop();

    //! Stop the execution loop.
    void stop();

  private:
    //! The asynchronous event loop scheduler.
    std::shared_ptr<boost::asio::io_context> io_context_;

    //! The work-tracking executor that keep the scheduler running.
    boost::asio::execution::any_executor<> work_;

    std::unique_ptr<node::Client> node_client_;
};

std::ostream& operator<<(std::ostream& out, Context& c);

class ContextPool {
public:
    explicit ContextPool(std::size_t pool_size, const ClientFactory& create_client);
    ~ContextPool();

    ContextPool(const ContextPool&) = delete;
    ContextPool& operator=(const ContextPool&) = delete;

    void start();

    void join();

    void stop();

    void run();

    Context& next_context();

    boost::asio::io_context& next_io_context();

private:
    // The pool of contexts
    std::vector<Context> contexts_;

    //! The pool of threads running the execution contexts.
    boost::asio::detail::thread_group context_threads_;

    // The next index to use for a context
    std::size_t next_index_;
};

} // namespace blockgate

#endif // BLOCKGATE_CONCURRENCY_CONTEXT_POOL_HPP_
