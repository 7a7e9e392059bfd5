// Process dispatcher - includes platform-specific implementation
// CMakeLists.txt compiles this file only; the preprocessor selects the
// platform implementation (and with it the DetachPolicy).

#ifdef _WIN32
#include "process_win32.cpp"
#else
#include "process_posix.cpp"
#endif
