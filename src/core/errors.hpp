#pragma once

#include <stdexcept>
#include <string>

// Connection or I/O failure against the clustered volume.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

// The recovery lock is held by someone else. Not an operational error.
class LockContention : public StorageError {
public:
    explicit LockContention(const std::string& what) : StorageError(what) {}
};

// A probe failed, timed out, or the lock file is no longer the one we locked.
class LivenessFailure : public std::runtime_error {
public:
    explicit LivenessFailure(const std::string& what) : std::runtime_error(what) {}
};
