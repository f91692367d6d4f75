#pragma once

namespace tabula::server {

class RequestRouter;

class RouterModule {
public:
    virtual ~RouterModule() = default;
    virtual void register_handlers(RequestRouter& router) = 0;
};

} // namespace tabula::server
