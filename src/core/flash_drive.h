#pragma once

#include <string>

#include "bytes.h"

namespace tekanim::core {

// Tape emulator entry names look like a TLIST listing line:
//   "11     ASCII   PROG Pi to length     3000"
// file number (7 columns), type (8), name (21), a space, then the size.
struct FlashDriveName {
    int number = 0;
    std::string type;
    std::string name;
    size_t size = 0;
};

constexpr const char k_player_name[] = "PROG Animation player";
constexpr const char k_player_file_type[] = "ASCII";
constexpr int k_player_file_number = 1;

std::string build_flash_drive_filename(int number, const std::string& type, const std::string& name,
                                       size_t size);
bool parse_flash_drive_filename(const std::string& filename, FlashDriveName& out);

std::string frame_entry_name(int frame_index);
bool is_player_name(const std::string& name);

// BASIC program that draws tape files first_file..final_file in turn. With a
// positive `automate_delay` it triggers a camera on port @53 and pauses that
// many seconds between frames; otherwise it waits for user key 1.
Bytes build_player_program(int first_file, int final_file, double automate_delay);

bool get_player_program_bounds(const Bytes& player, int& first_file, int& final_file);
bool set_player_program_bounds(Bytes& player, int first_file, int final_file);

} // namespace tekanim::core
