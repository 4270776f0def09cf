//----------------------------------------------------------------------------------------------------------------------
// File: AsioUtils.hpp
// Description: Helpers to drive asio operations to completion on the calling thread. A stop request cancels the
// pending operation through the supplied cancel function, the completion handler then observes operation_aborted.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/system/error_code.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <stop_token>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Network::TCP {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] bool IsInducedError(boost::system::error_code const& error);

template<typename CancelFunction>
void RunUntilComplete(boost::asio::io_context& context, std::stop_token const& token, CancelFunction&& cancel);

//----------------------------------------------------------------------------------------------------------------------
} // Network::TCP namespace
//----------------------------------------------------------------------------------------------------------------------

inline bool Network::TCP::IsInducedError(boost::system::error_code const& error)
{
    switch (error.value()) {
        case boost::asio::error::operation_aborted:
        case boost::asio::error::shut_down: {
            return true;
        }
        default: return false;
    }
}

//----------------------------------------------------------------------------------------------------------------------

template<typename CancelFunction>
void Network::TCP::RunUntilComplete(
    boost::asio::io_context& context, std::stop_token const& token, CancelFunction&& cancel)
{
    // A context that ran out of work stays stopped until it is restarted.
    context.restart();
    std::stop_callback const callback{ token, [&context, &cancel] () { boost::asio::post(context, cancel); } };
    context.run();
}

//----------------------------------------------------------------------------------------------------------------------
