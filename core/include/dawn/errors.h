#pragma once

#include "dawn/json_mini.h"

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace dawn {

// Failure taxonomy. Every kind is written to the ledger as errors.type.
enum class ErrorKind {
    BUDGET_PROJECT_LIMIT,
    BUDGET_TIMEOUT,
    BUDGET_OUTPUT_LIMIT,
    POLICY_VIOLATION,
    MISSING_REQUIRED_ARTIFACT,
    PRODUCED_ARTIFACT_MISSING,
    SCHEMA_INVALID,
    REHYDRATION_FAILED,
    RUNTIME_ERROR,
    CONTRACT_VIOLATION,
    COHERENCE_DRIFT,
    PROJECT_BUSY,
    PIPELINE_INVALID,
};

const char* error_kind_name(ErrorKind k);
std::optional<ErrorKind> error_kind_from_name(const std::string& s);

// Policy document absent, malformed or failing validation.
class PolicyValidationError : public std::runtime_error {
public:
    explicit PolicyValidationError(const std::string& msg) : std::runtime_error(msg) {}
};

// Another process holds the project lock.
class ProjectBusyError : public std::runtime_error {
public:
    explicit ProjectBusyError(const std::string& msg) : std::runtime_error(msg) {}
};

// Pipeline spec or link manifest rejected before anything executes.
class PipelineError : public std::runtime_error {
public:
    explicit PipelineError(const std::string& msg) : std::runtime_error(msg) {}
};

// A link-level failure. context holds the full {type, message, ...} object
// written to the ledger; logged is set once that write happened.
class LinkFailure : public std::runtime_error {
public:
    LinkFailure(ErrorKind kind, const std::string& message, json_mini::Doc context = {});

    ErrorKind kind() const { return kind_; }
    // Borrowed {type, message, ...} object.
    json_object* context() const { return context_ ? context_->root : nullptr; }

    bool logged() const { return logged_; }
    void mark_logged() { logged_ = true; }

private:
    ErrorKind kind_;
    // shared so the exception stays copyable
    std::shared_ptr<json_mini::Doc> context_;
    bool logged_{false};
};

// Raised by RunPipeline after the index and run summary were persisted.
class PipelineRunError : public std::runtime_error {
public:
    PipelineRunError(const std::string& link_id, ErrorKind kind, const std::string& message)
        : std::runtime_error("Pipeline failed at link " + link_id + ": " + message),
          link_id_(link_id), kind_(kind) {}

    const std::string& link_id() const { return link_id_; }
    ErrorKind kind() const { return kind_; }

private:
    std::string link_id_;
    ErrorKind kind_;
};

} // namespace dawn
