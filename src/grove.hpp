/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef GROVE_GROVE_HPP
#define GROVE_GROVE_HPP

#include "common.hpp"
#include "content.hpp"
#include "error/forest.hpp"
#include "error/tree.hpp"
#include "forest.hpp"
#include "node.hpp"
#include "traversal.hpp"
#include "tree.hpp"
#include "tree_id.hpp"

#endif // GROVE_GROVE_HPP
