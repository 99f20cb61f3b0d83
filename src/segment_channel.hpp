#pragma once

#include <boost/asio/experimental/channel.hpp>
#include <boost/system/error_code.hpp>
#include <hlsget/types.hpp>

namespace hlsget {

// Bounded queue between the resolver and the fetch pool. A message carrying
// asio::error::eof ends the stream; any other error code is the resolver's
// fatal error.
using SegmentChannel = boost::asio::experimental::channel<void(
	boost::system::error_code, SegmentDescriptor)>;

}  // namespace hlsget
