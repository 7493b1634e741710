#pragma once

#include "i_transport.h"
#include <memory>

namespace qedl {

struct SessionOptions;

class TransportFactory {
public:
    // Builds (does not open) the backend selected by the options
    static std::unique_ptr<ITransport> create(const SessionOptions& options);
};

} // namespace qedl
