#pragma once

#include <ddl/parse_table.hpp>
#include <ddl/pattern_table.hpp>
#include <ddl/terminal_mapper.hpp>
#include <ddl/xml_reader.hpp>

namespace ddl {

  // Everything that makes the engine recognize one language.
  struct grammar {
    pattern_table patterns;
    keyword_map keywords;
    parse_table table;

    static grammar
    defaults();

    // Reads a <grammar> document. Sections the document leaves out keep
    // their defaults. Throws grammar_error.
    static grammar
    load(xml_reader& reader);
  };

} // namespace ddl
