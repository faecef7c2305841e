#pragma once

#include <stdexcept>
#include <string>

class GatenetError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// shape-incompatible matrix operation or wrongly sized network input/target
class DimensionMismatchError : public GatenetError
{
public:
    using GatenetError::GatenetError;
};

class InvalidArchitectureError : public GatenetError
{
public:
    using GatenetError::GatenetError;
};

class IoError : public GatenetError
{
public:
    using GatenetError::GatenetError;
};

class CorruptFormatError : public GatenetError
{
public:
    using GatenetError::GatenetError;
};

class UnsupportedVersionError : public GatenetError
{
public:
    UnsupportedVersionError(const std::string& message, const std::string& version)
        : GatenetError(message), version(version)
    {
    }

    const std::string& get_version() const
    {
        return version;
    }

private:
    std::string version;
};

// stored parameter shapes disagree with the declared architecture
class ArchitectureMismatchError : public GatenetError
{
public:
    using GatenetError::GatenetError;
};

class NothingToResumeError : public GatenetError
{
public:
    using GatenetError::GatenetError;
};
