#pragma once
#include <string>

struct WorkerIdentity {
    std::string hostname;
    long pid{0};
    std::string id; // "hostname:pid"

    static WorkerIdentity current();
};
