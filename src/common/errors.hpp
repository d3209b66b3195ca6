#pragma once

#include <stdexcept>
#include <string>

namespace driftwatch {

class DriftwatchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The monitored directory is missing, not a directory, or cannot be listed.
// Fatal to the current scan; persisted state is left untouched.
class DirectoryUnavailable : public DriftwatchError {
public:
    explicit DirectoryUnavailable(const std::string &directory,
                                  const std::string &reason)
        : DriftwatchError("directory unavailable: " + directory + ": " + reason)
        , m_directory(directory)
    {
    }

    const std::string &directory() const
    {
        return m_directory;
    }

private:
    std::string m_directory;
};

// Persisted state missing, unreadable or malformed. Recovered as empty state.
class StateLoadFailure : public DriftwatchError {
public:
    using DriftwatchError::DriftwatchError;
};

// Updated state could not be written. The scan result stays valid.
class StateSaveFailure : public DriftwatchError {
public:
    using DriftwatchError::DriftwatchError;
};

// A single directory entry could not be inspected. The entry is skipped.
class EntryMetadataFailure : public DriftwatchError {
public:
    using DriftwatchError::DriftwatchError;
};

// Another scan holds the state lock.
class StateLockUnavailable : public DriftwatchError {
public:
    using DriftwatchError::DriftwatchError;
};

} // namespace driftwatch
