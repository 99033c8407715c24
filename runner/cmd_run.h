#pragma once

// dawn_cli run <project> <pipeline.yaml> [--profile P]
int cmd_run(int argc, char** argv);
