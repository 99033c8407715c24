#include "builtin_links.h"

namespace dawn {

void register_builtin_links(LinkTable& table) {
    table.add("ingest.project_bundle", link_ingest_project_bundle);
    table.add("logic.generate_ir", link_generate_ir);
    table.add("logic.generate_ir_v2", link_generate_ir_v2);
    table.add("validate.json_artifacts", link_validate_json_artifacts);
    table.add("package.project_report", link_package_project_report);
}

} // namespace dawn
