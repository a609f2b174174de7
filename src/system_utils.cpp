#include "system_utils.hpp"
#ifndef _WIN32
#include <sys/utsname.h>
#endif

namespace procutil {

std::string host_os_name() {
#ifdef _WIN32
    return "Windows";
#else
    struct utsname info {};
    if (uname(&info) != 0)
        return "unknown";
    return info.sysname;
#endif
}

} // namespace procutil
