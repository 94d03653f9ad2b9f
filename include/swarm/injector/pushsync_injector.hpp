/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#define BOOST_DI_CFG_CTOR_LIMIT_SIZE 16

#include <boost/asio/io_context.hpp>
#include <boost/di.hpp>
#include <swarm/crypto/signer.hpp>
#include <swarm/network/streamer.hpp>

// implementations
#include <swarm/accounting/inmem_accounting.hpp>
#include <swarm/chunk/content_hash_validator.hpp>
#include <swarm/pricer/proximity_pricer.hpp>
#include <swarm/protocol/pushsync/pushsync.hpp>
#include <swarm/storage/inmem_store.hpp>
#include <swarm/tags/inmem_tags.hpp>

namespace swarm::injector {

  /**
   * @brief Overlay address of the local node. Must be provided.
   */
  inline auto useSelfAddress(Address self) {
    return boost::di::bind<Address>().to(std::move(self))[boost::di::override];
  }

  inline auto usePushSyncConfig(protocol::pushsync::PushSyncConfig config) {
    return boost::di::bind<protocol::pushsync::PushSyncConfig>().to(
        std::move(config))[boost::di::override];
  }

  /**
   * @brief Creates injector of one pushsync node.
   *
   * The caller binds what depends on the deployment: the `io_context`, the
   * local address, the streamer, the topology driver and the signer.
   * @code
   * auto injector = makePushSyncInjector(
   *     boost::di::bind<boost::asio::io_context>().to(io_context),
   *     useSelfAddress(self),
   *     boost::di::bind<network::Streamer>().to(network->streamer(self)),
   *     boost::di::bind<topology::Driver>().to(topology),
   *     boost::di::bind<crypto::Signer>().to(signer));
   * auto pushsync =
   *     injector.create<std::shared_ptr<protocol::pushsync::PushSync>>();
   * @endcode
   *
   * @tparam InjectorConfig configuration for the injector
   * @tparam Ts types of injector bindings
   * @param args injector bindings that override default bindings
   */
  template <typename InjectorConfig = BOOST_DI_CFG, typename... Ts>
  inline auto makePushSyncInjector(Ts &&...args) {
    namespace di = boost::di;

    // clang-format off
    return di::make_injector<InjectorConfig>(
        di::bind<accounting::Accounting>.to<accounting::InmemAccounting>(),
        di::bind<storage::Putter>.to<storage::InmemStore>(),
        di::bind<tags::Tags>.to<tags::InmemTags>(),
        di::bind<pricer::Pricer>.to<pricer::ProximityPricer>(),
        di::bind<chunk::Validator>.to<chunk::ContentHashValidator>(),
        // User-defined overrides...
        std::forward<decltype(args)>(args)...
    );
    // clang-format on
  }

}  // namespace swarm::injector
