/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <swarm/common/context.hpp>
#include <swarm/connection/stream.hpp>

namespace swarm::connection {

  /**
   * Resets `stream` when `ctx` is canceled or its deadline passes while the
   * guard is alive, which fails the read or write in progress.
   * Must be created and destroyed on the `io_context` thread.
   */
  class StreamDeadline {
   public:
    StreamDeadline(boost::asio::io_context &io_context,
                   std::shared_ptr<Stream> stream,
                   const Context &ctx)
        : timer_{io_context},
          armed_{std::make_shared<bool>(true)},
          // cancel may come from another thread
          cancel_{ctx.onCancel([&io_context, stream, armed{armed_}] {
            boost::asio::post(io_context, [stream, armed] {
              if (*armed) {
                stream->reset();
              }
            });
          })} {
      auto deadline = ctx.deadline();
      if (not deadline.has_value()) {
        return;
      }
      timer_.expires_at(*deadline);
      timer_.async_wait([stream](boost::system::error_code ec) {
        if (not ec) {
          stream->reset();
        }
      });
    }

    ~StreamDeadline() {
      *armed_ = false;
      timer_.cancel();
    }

    StreamDeadline(const StreamDeadline &) = delete;
    StreamDeadline &operator=(const StreamDeadline &) = delete;

   private:
    boost::asio::steady_timer timer_;
    std::shared_ptr<bool> armed_;
    Context::CancelRegistration cancel_;
  };

}  // namespace swarm::connection
