// ============= include/core/errors.hpp =============
#pragma once
#include <stdexcept>
#include <string>

namespace photorank {

// Aborta el pipeline completo de un album (directorio ilegible, cache no promovido)
class PipelineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// El proveedor de deteccion/embedding no puede ejecutarse en absoluto
class ModelUnavailableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class NoFaceFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class PersonNotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class AlbumNotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace photorank
