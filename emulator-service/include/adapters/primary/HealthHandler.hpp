#pragma once

#include <IHttpHandler.hpp>

namespace emulator::adapters::primary
{

    class HealthHandler : public IHttpHandler
    {
    public:
        void handle(IRequest & /*req*/, IResponse &res) override
        {
            res.setResult(200, "application/json", R"({"status":"healthy","service":"accounting-emulator"})");
        }
    };

} // namespace emulator::adapters::primary
