#ifndef dcx_ENV_H
#define dcx_ENV_H

#include "dcx_string.h"

// Reads KEY=VALUE lines into the process environment.
// Blank lines and lines starting with '#' are skipped. A missing file is not an error.
void load_env_file(const dcx_string& filepath);

#endif // dcx_ENV_H
