#include "../include/worker_identity.hpp"
#include <sys/utsname.h>
#include <unistd.h>
#include <climits>

#ifndef HOST_NAME_MAX
#define HOST_NAME_MAX 255
#endif

static std::string local_hostname() {
    char buf[HOST_NAME_MAX + 1] = {};
    if (gethostname(buf, sizeof(buf) - 1) == 0 && buf[0] != '\0') return std::string(buf);
    struct utsname u {};
    if (uname(&u) == 0) return std::string(u.nodename);
    return "localhost";
}

WorkerIdentity WorkerIdentity::current() {
    WorkerIdentity w;
    w.hostname = local_hostname();
    w.pid = static_cast<long>(getpid());
    w.id = w.hostname + ":" + std::to_string(w.pid);
    return w;
}
