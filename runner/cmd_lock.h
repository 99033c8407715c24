#pragma once

// dawn_cli lock generate <project> [--stdout]
// dawn_cli lock verify <project>
// dawn_cli lock compare <lock_a.json> <lock_b.json>
int cmd_lock(int argc, char** argv);
