#ifndef __I_CONTROLLER_CHANNEL_HPP__
#define __I_CONTROLLER_CHANNEL_HPP__

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace PrintRelay {

/**
 * ControllerEvent - One named event received from the remote controller.
 */
struct ControllerEvent {
    std::string    name; ///< Event name, e.g. "pc-agent:print-job"
    nlohmann::json data; ///< Event payload, null when the event carries none
};

/**
 * IControllerChannel - Transport of the outbound session to the remote controller.
 *
 * A channel is a single connection attempt: once it is lost or closed it is not reopened,
 * the session creates a new one through its factory.
 *
 * Threading:
 * A channel is used by one thread at a time. RemoteSession opens it on the connecting thread
 * and then hands it over to its loop thread.
 *
 * Errors:
 * - open() throws ConnectError/ConnectTimeout when the controller is unreachable,
 *   ChannelError when it rejects the session.
 * - poll() and emit() throw ChannelError once the connection is lost.
 */
class IControllerChannel {
public:
    virtual ~IControllerChannel() = default;

    virtual void open() = 0;

    // Waits up to timeout_ms for incoming events. Returns as soon as one is available,
    // an empty vector on timeout.
    virtual std::vector<ControllerEvent> poll(int timeout_ms) = 0;

    virtual void emit(const std::string &event, const nlohmann::json &data) = 0;

    // Idempotent, never throws.
    virtual void close() noexcept = 0;

    virtual bool is_open() const = 0;
};

using ControllerChannelPtr     = std::unique_ptr<IControllerChannel>;
using ControllerChannelFactory = std::function<ControllerChannelPtr()>;

} // namespace PrintRelay

#endif // __I_CONTROLLER_CHANNEL_HPP__
