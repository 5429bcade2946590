//
// The connection a sender adapter reports back through
//

#ifndef TRANSIT_RELAY_I_SENDER_TRANSPORT_H
#define TRANSIT_RELAY_I_SENDER_TRANSPORT_H

#include <string>

// Websocket close status codes
const int CLOSE_STATUS_NORMAL = 1000;
const int CLOSE_STATUS_ERROR = 1011;

class ISenderTransport {
public:
    virtual ~ISenderTransport() = default;

    virtual void sendText(const std::string& message) = 0;
    virtual void close(int status, const std::string& reason) = 0;
};

#endif //TRANSIT_RELAY_I_SENDER_TRANSPORT_H
