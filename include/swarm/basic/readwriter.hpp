/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <swarm/basic/reader.hpp>
#include <swarm/basic/writer.hpp>

namespace swarm::basic {

  struct ReadWriter : public Reader, public Writer {};

}  // namespace swarm::basic
