#pragma once

#include "SmoothWrite/notes/note.hpp"

namespace SmoothWrite::notes {

/**
 * @brief Build the note shown to first-time users (not yet persisted)
 */
[[nodiscard]] Note createWelcomeNote();

} // namespace SmoothWrite::notes
