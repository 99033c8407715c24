#include "dawn/errors.h"

#include <memory>

namespace dawn {

namespace {

struct KindName {
    ErrorKind kind;
    const char* name;
};

constexpr KindName kNames[] = {
    {ErrorKind::BUDGET_PROJECT_LIMIT, "BUDGET_PROJECT_LIMIT"},
    {ErrorKind::BUDGET_TIMEOUT, "BUDGET_TIMEOUT"},
    {ErrorKind::BUDGET_OUTPUT_LIMIT, "BUDGET_OUTPUT_LIMIT"},
    {ErrorKind::POLICY_VIOLATION, "POLICY_VIOLATION"},
    {ErrorKind::MISSING_REQUIRED_ARTIFACT, "MISSING_REQUIRED_ARTIFACT"},
    {ErrorKind::PRODUCED_ARTIFACT_MISSING, "PRODUCED_ARTIFACT_MISSING"},
    {ErrorKind::SCHEMA_INVALID, "SCHEMA_INVALID"},
    {ErrorKind::REHYDRATION_FAILED, "REHYDRATION_FAILED"},
    {ErrorKind::RUNTIME_ERROR, "RUNTIME_ERROR"},
    {ErrorKind::CONTRACT_VIOLATION, "CONTRACT_VIOLATION"},
    {ErrorKind::COHERENCE_DRIFT, "COHERENCE_DRIFT"},
    {ErrorKind::PROJECT_BUSY, "PROJECT_BUSY"},
    {ErrorKind::PIPELINE_INVALID, "PIPELINE_INVALID"},
};

} // namespace

const char* error_kind_name(ErrorKind k) {
    for (const auto& kn : kNames) {
        if (kn.kind == k) return kn.name;
    }
    return "RUNTIME_ERROR";
}

std::optional<ErrorKind> error_kind_from_name(const std::string& s) {
    for (const auto& kn : kNames) {
        if (s == kn.name) return kn.kind;
    }
    return std::nullopt;
}

LinkFailure::LinkFailure(ErrorKind kind, const std::string& message, json_mini::Doc context)
    : std::runtime_error(message), kind_(kind) {
    if (!context || !json_mini::is_object(context.root)) context = json_mini::new_object();
    if (!json_mini::get(context.root, "type")) {
        json_mini::put_string(context.root, "type", error_kind_name(kind));
    }
    if (!json_mini::get(context.root, "message")) {
        json_mini::put_string(context.root, "message", message);
    }
    context_ = std::make_shared<json_mini::Doc>(std::move(context));
}

} // namespace dawn
