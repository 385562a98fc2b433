// ============= include/core/logging.hpp =============
#pragma once
#include "config/ranking_config.hpp"

namespace photorank {

// Instala el logger por defecto de spdlog: consola con color + archivo opcional.
// Lanza ConfigError si el archivo de log no se puede abrir.
void setup_logging(const LoggingConfig& config);

} // namespace photorank
