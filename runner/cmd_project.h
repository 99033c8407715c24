#pragma once

// dawn_cli inspect <project>
int cmd_inspect(int argc, char** argv);
// dawn_cli verify-ledger <project>
int cmd_verify_ledger(int argc, char** argv);
// dawn_cli prune <project> [--dry-run] [--json]
int cmd_prune(int argc, char** argv);
// dawn_cli approve-shadow <project> <stable> <shadow> [--by NAME]
int cmd_approve_shadow(int argc, char** argv);
