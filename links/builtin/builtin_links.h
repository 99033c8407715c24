#pragma once

#include "dawn/link_api.h"

namespace dawn {

// Built-in demo links, linked statically into dawn_cli and the tests.
LinkResult link_ingest_project_bundle(LinkContext& ctx);
LinkResult link_generate_ir(LinkContext& ctx);
LinkResult link_generate_ir_v2(LinkContext& ctx);
LinkResult link_validate_json_artifacts(LinkContext& ctx);
LinkResult link_package_project_report(LinkContext& ctx);

// Registers every link above under its manifest id.
void register_builtin_links(LinkTable& table);

} // namespace dawn
