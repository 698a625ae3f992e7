#pragma once

// cmd_encode_time: ulid_cli encode-time <milliseconds>
// Prints the 10-symbol time field. Exit 1 for non-numeric or out-of-range input.
int cmd_encode_time(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
