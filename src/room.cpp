// src/room.cpp: line-oriented scraper for room descriptions
#include "synvm/room.hpp"

#include <cstring>
#include <utility>

#include "synvm/errors.hpp"
#include "synvm/vm_api.h"

namespace synvm
{
namespace
{

// Reads one line including its '\n' (if any). False at end of text.
bool read_line(const char *text, std::size_t len, std::size_t *pos, std::string *line)
{
  line->clear();
  if (*pos >= len)
    return false;

  const void *nl = std::memchr(text + *pos, '\n', len - *pos);
  std::size_t end = nl ? static_cast<std::size_t>(static_cast<const char *>(nl) - text) + 1 : len;
  line->assign(text + *pos, end - *pos);
  *pos = end;
  return true;
}

std::string chomp(const std::string &line)
{
  std::size_t n = line.size();
  while (n > 0 && (line[n - 1] == '\n' || line[n - 1] == '\r'))
    --n;
  return line.substr(0, n);
}

bool starts_with(const std::string &s, const char *prefix)
{
  return s.compare(0, std::strlen(prefix), prefix) == 0;
}

// "= Foothills ==" (the first '=' was consumed with the prelude)
std::string clean_title(const std::string &line)
{
  std::string t = chomp(line);
  std::size_t b = t.find_first_not_of("= ");
  if (b == std::string::npos)
    return std::string();
  std::size_t e = t.find_last_not_of("= ");
  return t.substr(b, e - b + 1);
}

}  // namespace

synvm_err parse_room(const char *text, std::size_t len, std::size_t *cursor, RoomParse *out)
{
  if (!text && len)
    return SYNVM_ERR(InvalidArg);
  if (!cursor || !out || *cursor > len)
    return SYNVM_ERR(InvalidArg);

  RoomParse r;
  std::size_t pos = *cursor;

  // Everything up to the header marker is the prelude
  const void *eq = len > pos ? std::memchr(text + pos, '=', len - pos) : nullptr;
  if (!eq)
  {
    r.prelude.assign(text + pos, len - pos);
    *out = std::move(r);
    *cursor = len;
    return SYNVM_ERR(OK);
  }
  std::size_t eq_pos = static_cast<std::size_t>(static_cast<const char *>(eq) - text);
  r.prelude.assign(text + pos, eq_pos - pos);
  pos = eq_pos + 1;

  std::string line;
  if (!read_line(text, len, &pos, &line))
  {
    *out = std::move(r);
    *cursor = len;
    return SYNVM_ERR(OK);
  }
  r.has_room = true;
  r.room.title = clean_title(line);

  // Description runs until the first list header or the prompt
  std::string header;
  while (read_line(text, len, &pos, &line))
  {
    std::string s = chomp(line);
    if (s == kRoomPrompt || (!s.empty() && s.back() == ':'))
    {
      header = s;
      break;
    }
    r.room.description += line;
  }
  while (!r.room.description.empty() && r.room.description.back() == '\n')
    r.room.description.pop_back();

  // "Things of interest here:" / "There are N exits:" lists
  while (!header.empty() && header != kRoomPrompt)
  {
    std::vector<std::string> *list;
    if (starts_with(header, "There"))
      list = &r.room.exits;
    else if (starts_with(header, "Things"))
      list = &r.room.items;
    else
      return SYNVM_ERR(InvalidArg);

    while (read_line(text, len, &pos, &line))
    {
      std::string item = chomp(line);
      if (item.empty())
        break;
      if (starts_with(item, "- "))
        item.erase(0, 2);
      list->push_back(item);
    }

    header.clear();
    while (header.empty() && read_line(text, len, &pos, &line))
      header = chomp(line);
  }

  *out = std::move(r);
  *cursor = pos;
  return SYNVM_ERR(OK);
}

synvm_err parse_room(Vm *vm, RoomParse *out)
{
  if (!vm || !out)
    return SYNVM_ERR(InvalidArg);

  std::size_t len = 0;
  const synvm_u8 *data = vm_output_data(vm, &len);
  if (!data && vm_output_seek(vm, 0) == SYNVM_ERR(NotBuffered))
    return SYNVM_ERR(NotBuffered);

  const char *text = data ? reinterpret_cast<const char *>(data) : "";
  std::size_t cursor = vm_output_tell(vm);
  synvm_err e = parse_room(text, len, &cursor, out);
  if (e)
    return e;
  return vm_output_seek(vm, cursor);
}

}  // namespace synvm
