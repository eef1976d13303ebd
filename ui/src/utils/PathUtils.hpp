#pragma once

#include <QString>

namespace horus::shell::utils {

//! Expand environment placeholders ($VAR, ${VAR}, %VAR%); unknown variables are kept verbatim.
QString expandEnvironmentPlaceholders(const QString& text);

//! Expand '~', '~user', file: URLs and relative segments into a clean absolute path.
QString expandPath(const QString& path);

} // namespace horus::shell::utils
