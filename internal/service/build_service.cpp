#include "build_service.hpp"

#include "internal/db/api/build_store.hpp"
#include "internal/scheduler/build_scheduler.hpp"
#include "internal/util/uuid.hpp"
#include "observe_rpc.hpp"

namespace osforge::service {

using namespace osforge::build::v1;

namespace {

void RequireBuildId(const std::string& id) {
  if (id.empty()) {
    throw util::InvalidArgument("build_id is required");
  }
  if (!util::IsCanonicalUUID(id)) {
    throw util::InvalidArgument("malformed build_id: " + id);
  }
}

void FillLog(const db::model::LogEntry& entry, osforge::build::v1::LogEntry* out) {
  *out->mutable_created_at() = util::ToProto(entry.created_at);
  out->set_message(entry.message);
}

} // namespace

BuildService::BuildService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StartBuildResponse BuildService::StartBuild(const StartBuildRequest& req) {
  return ObserveRpc("BuildService.StartBuild", "", [&] {
    std::string build_id;
    switch (req.source_case()) {
      case StartBuildRequest::kSpec:
        build_id = ctx_.scheduler->Submit(req.spec());
        break;
      case StartBuildRequest::kSpecJson:
        build_id = ctx_.scheduler->Submit(req.spec_json());
        break;
      default:
        throw util::ValidationError("build specification is required");
    }

    StartBuildResponse resp;
    resp.set_build_id(build_id);
    return resp;
  });
}

GetBuildStatusResponse BuildService::GetBuildStatus(const GetBuildStatusRequest& req) {
  return ObserveRpc("BuildService.GetBuildStatus", req.build_id(), [&] {
    RequireBuildId(req.build_id());

    auto record = ctx_.store->Get(req.build_id());
    if (!record) {
      throw util::NotFound("build not found: " + req.build_id());
    }

    GetBuildStatusResponse resp;
    resp.set_build_id(record->id);
    resp.set_status(osforge::model::ToProto(record->status));
    *resp.mutable_spec()       = record->spec;
    *resp.mutable_created_at() = util::ToProto(record->created_at);
    if (record->completed_at) {
      *resp.mutable_completed_at() = util::ToProto(*record->completed_at);
    }

    for (const auto& entry : record->logs) {
      FillLog(entry, resp.add_logs());
    }
    for (const auto& artifact : record->artifacts) {
      auto*      out  = resp.add_artifacts();
      const auto type = std::string(osforge::model::ToString(artifact.type));
      out->set_file_type(type);
      out->set_file_name(artifact.file_name);
      out->set_url(artifact.url);
      auto& urls = *resp.mutable_download_urls();
      if (urls.count(type) == 0) {
        urls[type] = artifact.url;
      }
    }
    return resp;
  });
}

GetBuildLogsResponse BuildService::GetBuildLogs(const GetBuildLogsRequest& req) {
  return ObserveRpc("BuildService.GetBuildLogs", req.build_id(), [&] {
    RequireBuildId(req.build_id());

    const auto slice = ctx_.store->ReadLogs(req.build_id(), req.offset());

    GetBuildLogsResponse resp;
    resp.set_status(osforge::model::ToProto(slice.status));
    for (const auto& entry : slice.entries) {
      FillLog(entry, resp.add_logs());
    }
    resp.set_next_offset(slice.next_offset);
    return resp;
  });
}

} // namespace osforge::service
