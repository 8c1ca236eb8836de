#pragma once

// Print the liveshift usage information
void printMigrateUsage();

// Main entry point: liveshift [--config <file>] <command> [args]
int migrateMain(int argc, char* argv[]);
