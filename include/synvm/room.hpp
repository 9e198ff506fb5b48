/**
 * @file room.hpp
 * @brief Room record scraper for guest output
 *
 * SPDX-License-Identifier: MIT OR Apache-2.0
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "synvm/vm_api.h"

namespace synvm
{

/**
 * @brief One room as printed by the guest
 *
 *   == Foothills ==
 *   You find yourself standing at the base of an enormous mountain.
 *
 *   Things of interest here:
 *   - tablet
 *
 *   There are 2 exits:
 *   - doorway
 *   - south
 *
 *   What do you do?
 */
struct Room
{
  std::string title;
  std::string description;
  std::vector<std::string> items;
  std::vector<std::string> exits;
};

/**
 * @brief Result of one parse
 *
 * `prelude` holds everything printed before the room header (messages from
 * the previous command). When no header follows, has_room is false.
 */
struct RoomParse
{
  std::string prelude;
  bool has_room = false;
  Room room;
};

/** Prompt line that ends a room. */
constexpr const char *kRoomPrompt = "What do you do?";

/**
 * @brief Parse the next room from text
 *
 * @param text    Output text
 * @param len     Text length in bytes
 * @param cursor  In: offset to start from. Out: offset after the consumed
 *                text (end of the prompt line, or len).
 * @param out     Parse result
 * @return 0 on success, SYNVM_ERR_InvalidArg for an unknown list header or
 *         bad arguments (cursor is not advanced on failure)
 */
synvm_err parse_room(const char *text, std::size_t len, std::size_t *cursor, RoomParse *out);

/**
 * @brief Parse the next room from a VM's unread output
 *
 * Consumes from the VM's output cursor (see vm_output_seek()).
 *
 * @return as parse_room(), or SYNVM_ERR_NotBuffered
 */
synvm_err parse_room(Vm *vm, RoomParse *out);

}  // namespace synvm
