#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"


///////////////////////////
///        DEMOS        ///
///////////////////////////
/**
 * @brief Sizes of the bundled synthetic department instances.
 */
enum class DemoSize { S, M, L };

/**
 * @brief Build a synthetic term of a mathematics and computer science department.
 */
ProblemInstance makeDemoInstance(DemoSize size);
