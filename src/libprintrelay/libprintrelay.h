#ifndef _libprintrelay_h_
#define _libprintrelay_h_

#define PRINTRELAY_APP_NAME "PrintRelay"
#define PRINTRELAY_APP_KEY "printrelay"
#define PRINTRELAY_VERSION "1.0.0"

// Endpoint defaults of a factory-fresh ESC/POS network printer.
#define PRINTRELAY_DEFAULT_PRINTER_IP "192.168.1.100"
#define PRINTRELAY_DEFAULT_PRINTER_PORT 9100

#endif // _libprintrelay_h_
