#pragma once

#include <stdexcept>
#include <string>

class CryptoTrackError : public std::runtime_error {
public:
    explicit CryptoTrackError(const std::string& what) : std::runtime_error(what) {}
};

// Transport failure, timeout, non-2xx status or undecodable body.
class NetworkError : public CryptoTrackError {
public:
    explicit NetworkError(const std::string& what) : CryptoTrackError(what) {}
};

// Well-formed response that does not carry the requested asset.
class NotFound : public CryptoTrackError {
public:
    explicit NotFound(const std::string& what) : CryptoTrackError(what) {}
};

class InvalidInput : public CryptoTrackError {
public:
    explicit InvalidInput(const std::string& what) : CryptoTrackError(what) {}
};
