#pragma once

// cmd_validate: ulid_cli validate <id>
// Exit status 0 when <id> is a well-formed identifier, 1 otherwise.
int cmd_validate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
