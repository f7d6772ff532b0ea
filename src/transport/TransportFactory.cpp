#include "transport/TransportFactory.h"
#include "transport/SerialTransport.h"
#include "transport/TcpTransport.h"
namespace nf {
std::unique_ptr<ITransport> createTransport(TransportKind kind) {
    if (kind == TransportKind::Tcp) return std::make_unique<TcpTransport>();
    return std::make_unique<SerialTransport>();
}
}
