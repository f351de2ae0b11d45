#pragma once

#include "cvforge/server/RequestContext.hpp"
#include "cvforge/server/Router.hpp"
#include "cvforge/service/TailorService.hpp"

#include <boost/asio/thread_pool.hpp>

namespace cvforge::controller {

// Completions block on outbound HTTPS, so tailoring runs on `worker` and the
// response is handed back to the server once it is ready.
class CvController {
public:
    CvController(service::TailorService& tailorService, boost::asio::thread_pool& worker);

    void registerRoutes(server::Router& router);

    // Runs the whole tailoring call on the calling thread.
    server::RequestContext::Response tailor(const service::TailorRequest& request);

private:
    void handleTailorCv(server::RequestContext& ctx);

    service::TailorService& tailorService_;
    boost::asio::thread_pool& worker_;
};

} // namespace cvforge::controller
