#pragma once
#include <istream>
#include <string>
#include "app/pronunciation_analyzer.hpp"

namespace io {

// Word-per-row CSV as written by `whisper-cli -ml 1 -sow -ocsv`:
//   start,end,text            (optionally start,end,speaker,text)
//   0,380,"The"
// Times are milliseconds; text is double-quoted with \" and \\ escapes.
// Empty words and bracketed non-speech tokens ([BLANK_AUDIO]) are skipped.
bool read_transcript_csv(std::istream& in, app::Transcript& out, std::string& error);

// Plain word list, one "start end word" row per line, times in seconds.
// A row holding more than one word is rejected. '#' starts a comment line.
bool read_transcript_words(std::istream& in, app::Transcript& out, std::string& error);

// Opens `path` and picks the reader by extension (.csv = whisper CSV).
bool load_transcript(const std::string& path, app::Transcript& out, std::string& error);
}
