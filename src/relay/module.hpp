#pragma once

namespace elrelay::relay {

class MessageRouter;

class RelayModule {
public:
    virtual ~RelayModule() = default;
    virtual void register_handlers(MessageRouter& router) = 0;
};

} // namespace elrelay::relay
