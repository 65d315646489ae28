#include "admin_service.hpp"

#include "internal/db/api/build_store.hpp"
#include "observe_rpc.hpp"

namespace osforge::service {

using namespace osforge::build::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

HealthResponse AdminService::Health(const HealthRequest&) {
  return ObserveRpc("AdminService.Health", "", [] {
    HealthResponse resp;
    resp.set_status("ok");
    return resp;
  });
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return ObserveRpc("AdminService.Stats", "", [&] {
    const auto counts = ctx_.store->CountByStatus();

    StatsResponse resp;
    resp.set_builds_pending(counts.pending);
    resp.set_builds_in_progress(counts.in_progress);
    resp.set_builds_succeeded(counts.succeeded);
    resp.set_builds_failed(counts.failed);
    return resp;
  });
}

} // namespace osforge::service
