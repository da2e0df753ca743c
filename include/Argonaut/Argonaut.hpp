/**
 * @file Argonaut.hpp
 * @brief Convenience header pulling in the whole public interface.
 */

#pragma once

#include "Argonaut/Core/Arguments.hpp"
#include "Argonaut/Core/Combine.hpp"
#include "Argonaut/Core/Description.hpp"
#include "Argonaut/Core/Flag.hpp"
#include "Argonaut/Core/HelpText.hpp"
#include "Argonaut/Core/Language.hpp"
#include "Argonaut/Core/Outcome.hpp"
#include "Argonaut/Core/Unicode.hpp"
#include "Argonaut/Core/Value.hpp"
#include "Argonaut/Utils/Error.hpp"
#include "Argonaut/Utils/Logging.hpp"
#include "Argonaut/Utils/Types.hpp"
