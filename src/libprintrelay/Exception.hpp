#ifndef _libprintrelay_Exception_h_
#define _libprintrelay_Exception_h_

#include <stdexcept>
#include <string>

namespace PrintRelay {

// PrintRelay's own exception hierarchy is derived from std::runtime_error.
class RuntimeError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

#define PRINTRELAY_DERIVE_EXCEPTION(DERIVED_EXCEPTION, PARENT_EXCEPTION) \
    class DERIVED_EXCEPTION : public PARENT_EXCEPTION { using PARENT_EXCEPTION::PARENT_EXCEPTION; }

// Faults of a local printer: refused, unreachable, timed out, broken stream.
PRINTRELAY_DERIVE_EXCEPTION(DeviceError,    RuntimeError);
PRINTRELAY_DERIVE_EXCEPTION(ConnectError,   DeviceError);
PRINTRELAY_DERIVE_EXCEPTION(ConnectTimeout, ConnectError);
PRINTRELAY_DERIVE_EXCEPTION(WriteError,     DeviceError);
// All connections of an endpoint stayed busy for the whole wait timeout.
PRINTRELAY_DERIVE_EXCEPTION(PoolTimeout,    RuntimeError);
PRINTRELAY_DERIVE_EXCEPTION(PayloadError,   RuntimeError);
// Uplink transport or protocol failure.
PRINTRELAY_DERIVE_EXCEPTION(ChannelError,   RuntimeError);
PRINTRELAY_DERIVE_EXCEPTION(ConfigError,    RuntimeError);

} // namespace PrintRelay

#endif // _libprintrelay_Exception_h_
