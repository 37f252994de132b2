#include <ddl/expat_reader.hpp>

#include <ddl/error.hpp>

#include <expat.h>

#include <string>
#include <utility>
#include <vector>

namespace ddl {

  namespace {

    struct attribute_entry {
      std::string name;
      std::string value;
    };

    struct node {
      xml_node_type type;
      std::string name;
      std::string text;
      std::vector<attribute_entry> attributes;
      std::size_t depth = 0;
      std::size_t line = 0;
    };

  } // namespace

  struct expat_reader::impl {
    XML_Parser parser = nullptr;
    std::vector<node> nodes;
    std::size_t cursor = 0;
    std::size_t current_depth = 0;

    std::size_t
    current_line() const {
      return static_cast<std::size_t>(XML_GetCurrentLineNumber(parser));
    }

    const node&
    current() const {
      return nodes[cursor - 1];
    }

    static void XMLCALL
    on_start_element(void* user_data, const char* name, const char** atts) {
      auto* self = static_cast<impl*>(user_data);
      self->current_depth++;

      node n;
      n.type = xml_node_type::start_element;
      n.name = name;
      n.depth = self->current_depth;
      n.line = self->current_line();
      for (const char** p = atts; *p != nullptr; p += 2)
        n.attributes.push_back({p[0], p[1]});

      self->nodes.push_back(std::move(n));
    }

    static void XMLCALL
    on_end_element(void* user_data, const char* name) {
      auto* self = static_cast<impl*>(user_data);

      node n;
      n.type = xml_node_type::end_element;
      n.name = name;
      n.depth = self->current_depth;
      n.line = self->current_line();

      self->nodes.push_back(std::move(n));
      self->current_depth--;
    }

    static void XMLCALL
    on_character_data(void* user_data, const char* s, int len) {
      auto* self = static_cast<impl*>(user_data);

      // Expat splits text at line breaks and entities; keep one node per run
      if (!self->nodes.empty() &&
          self->nodes.back().type == xml_node_type::characters) {
        self->nodes.back().text.append(s, static_cast<std::size_t>(len));
        return;
      }

      node n;
      n.type = xml_node_type::characters;
      n.text.assign(s, static_cast<std::size_t>(len));
      n.depth = self->current_depth;
      n.line = self->current_line();
      self->nodes.push_back(std::move(n));
    }
  };

  expat_reader::expat_reader(std::string_view xml)
      : impl_(std::make_unique<impl>()) {
    impl_->parser = XML_ParserCreate(nullptr);
    if (impl_->parser == nullptr)
      throw error("expat_reader: failed to create parser");

    XML_SetUserData(impl_->parser, impl_.get());
    XML_SetElementHandler(impl_->parser, impl::on_start_element,
                          impl::on_end_element);
    XML_SetCharacterDataHandler(impl_->parser, impl::on_character_data);

    XML_Status status = XML_Parse(impl_->parser, xml.data(),
                                  static_cast<int>(xml.size()), XML_TRUE);

    std::size_t line = impl_->current_line();
    std::string reason = XML_ErrorString(XML_GetErrorCode(impl_->parser));
    XML_ParserFree(impl_->parser);
    impl_->parser = nullptr;

    if (status == XML_STATUS_ERROR)
      throw grammar_error("malformed XML: " + reason, line);
    if (impl_->nodes.empty()) throw grammar_error("empty XML document", 0);
  }

  expat_reader::~expat_reader() = default;
  expat_reader::expat_reader(expat_reader&&) noexcept = default;
  expat_reader&
  expat_reader::operator=(expat_reader&&) noexcept = default;

  bool
  expat_reader::read() {
    if (impl_->cursor >= impl_->nodes.size()) return false;
    impl_->cursor++;
    return true;
  }

  xml_node_type
  expat_reader::node_type() const {
    return impl_->current().type;
  }

  const std::string&
  expat_reader::name() const {
    return impl_->current().name;
  }

  std::size_t
  expat_reader::attribute_count() const {
    return impl_->current().attributes.size();
  }

  std::string_view
  expat_reader::attribute_name(std::size_t index) const {
    return impl_->current().attributes[index].name;
  }

  std::string_view
  expat_reader::attribute_value(std::size_t index) const {
    return impl_->current().attributes[index].value;
  }

  std::optional<std::string_view>
  expat_reader::attribute(std::string_view attr_name) const {
    for (const auto& attr : impl_->current().attributes)
      if (attr.name == attr_name) return std::string_view(attr.value);
    return std::nullopt;
  }

  std::string_view
  expat_reader::text() const {
    return impl_->current().text;
  }

  std::size_t
  expat_reader::depth() const {
    return impl_->current().depth;
  }

  std::size_t
  expat_reader::line() const {
    return impl_->current().line;
  }

} // namespace ddl
