#pragma once

// Headless front end: parses the command line, renders one job to completion
// and writes the export. Returns a process exit code.
int run_cli(int argc, char* argv[]);
