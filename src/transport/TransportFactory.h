#pragma once
#include "transport/ITransport.h"
#include <memory>
namespace nf {
std::unique_ptr<ITransport> createTransport(TransportKind kind);
}
