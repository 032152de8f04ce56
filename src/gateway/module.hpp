#pragma once

namespace voxgate::gateway {

class OpRouter;

class GatewayModule {
public:
    virtual ~GatewayModule() = default;
    virtual void register_ops(OpRouter& router) = 0;
};

} // namespace voxgate::gateway
