#pragma once

namespace common
{

// Installs the timestamped stderr handler used by the command line front end.
// When quiet is set, info messages are filtered out and only warnings and errors print.
void initLogging(bool quiet = false);

} // namespace common
