#include "language_info_parser.h"
#include "debug_utils-inl.h"
#include "util.h"

#include <uv.h>

#include <charconv>
#include <optional>

namespace langmatch {

namespace {

std::optional<std::string_view> GetAttribute(const XML_Char** atts,
                                             std::string_view name) {
  for (size_t i = 0; atts[i] != nullptr; i += 2) {
    if (name == atts[i]) return std::string_view(atts[i + 1]);
  }
  return std::nullopt;
}

// Parses a `+`/`-` separated set expression such as `AS+CA+GU`. A `-` removes
// the following subtag from the set built so far.
bool ParseVariableValue(std::string_view value,
                        std::unordered_set<std::string>* out) {
  char op = '+';
  size_t start = 0;
  while (start <= value.size()) {
    size_t end = value.find_first_of("+-", start);
    std::string_view subtag = TrimSpaces(value.substr(
        start, end == std::string_view::npos ? std::string_view::npos
                                             : end - start));
    if (subtag.empty()) return false;
    if (op == '+')
      out->emplace(subtag);
    else
      out->erase(std::string(subtag));
    if (end == std::string_view::npos) break;
    op = value[end];
    start = end + 1;
  }
  return true;
}

}  // anonymous namespace

void XMLCALL LanguageInfoParser::StartElementHandler(void* user_data,
                                                     const XML_Char* name,
                                                     const XML_Char** atts) {
  static_cast<LanguageInfoParser*>(user_data)->StartElement(name, atts);
}

void XMLCALL LanguageInfoParser::EndElementHandler(void* user_data,
                                                   const XML_Char* name) {
  static_cast<LanguageInfoParser*>(user_data)->EndElement(name);
}

void LanguageInfoParser::Fail(std::string message) {
  if (!error_.empty()) return;
  error_ = SPrintF("line %u: %s",
                   XML_GetCurrentLineNumber(parser_),
                   message);
  XML_StopParser(parser_, XML_FALSE);
}

void LanguageInfoParser::StartElement(std::string_view name,
                                      const XML_Char** atts) {
  if (name == "languageMatches") {
    if (in_block_) return Fail("nested <languageMatches>");
    in_block_ = true;
    Block block;
    block.type = GetAttribute(atts, "type").value_or("");
    blocks_.push_back(std::move(block));
    return;
  }
  if (!in_block_) return;

  if (name == "paradigmLocales") {
    ParseParadigmLocales(atts);
  } else if (name == "matchVariable") {
    ParseMatchVariable(atts);
  } else if (name == "languageMatch") {
    ParseLanguageMatch(atts);
  }
}

void LanguageInfoParser::EndElement(std::string_view name) {
  if (name == "languageMatches") in_block_ = false;
}

void LanguageInfoParser::ParseParadigmLocales(const XML_Char** atts) {
  std::optional<std::string_view> locales = GetAttribute(atts, "locales");
  if (!locales.has_value())
    return Fail("<paradigmLocales> without a locales attribute");

  std::vector<std::string>& out = blocks_.back().data.paradigm_locales;
  for (std::string_view tag : SplitString(*locales, ' ', true))
    out.emplace_back(TrimSpaces(tag));
}

void LanguageInfoParser::ParseMatchVariable(const XML_Char** atts) {
  std::optional<std::string_view> id = GetAttribute(atts, "id");
  std::optional<std::string_view> value = GetAttribute(atts, "value");
  if (!id.has_value() || !value.has_value())
    return Fail("<matchVariable> requires id and value attributes");
  if (id->size() < 2 || id->front() != '$')
    return Fail(SPrintF("variable id '%s' does not start with '$'", *id));

  std::string name(id->substr(1));
  VariableTable& variables = blocks_.back().data.variables;
  if (variables.find(name) != variables.end())
    return Fail(SPrintF("variable $%s is defined twice", name));

  std::unordered_set<std::string> subtags;
  if (!ParseVariableValue(*value, &subtags))
    return Fail(SPrintF("malformed value '%s' for $%s", *value, name));
  variables.emplace(std::move(name), std::move(subtags));
}

void LanguageInfoParser::ParseLanguageMatch(const XML_Char** atts) {
  std::optional<std::string_view> desired = GetAttribute(atts, "desired");
  std::optional<std::string_view> supported = GetAttribute(atts, "supported");
  std::optional<std::string_view> distance = GetAttribute(atts, "distance");
  if (!desired.has_value() || !supported.has_value() || !distance.has_value())
    return Fail("<languageMatch> requires desired, supported and distance");

  std::optional<TagPattern> desired_pattern = TagPattern::Parse(*desired);
  if (!desired_pattern.has_value())
    return Fail(SPrintF("malformed desired pattern '%s'", *desired));
  std::optional<TagPattern> supported_pattern = TagPattern::Parse(*supported);
  if (!supported_pattern.has_value())
    return Fail(SPrintF("malformed supported pattern '%s'", *supported));

  int value = 0;
  auto [ptr, ec] =
      std::from_chars(distance->data(), distance->data() + distance->size(),
                      value);
  if (ec != std::errc() || ptr != distance->data() + distance->size() ||
      value < 0 || value > 100) {
    return Fail(SPrintF("distance '%s' is not an integer in 0..100",
                        *distance));
  }

  bool oneway = false;
  if (std::optional<std::string_view> flag = GetAttribute(atts, "oneway")) {
    if (*flag == "true") {
      oneway = true;
    } else if (*flag != "false") {
      return Fail(SPrintF("oneway must be true or false, got '%s'", *flag));
    }
  }

  blocks_.back().data.rules.push_back(MatchRule{std::move(*desired_pattern),
                                                std::move(*supported_pattern),
                                                value,
                                                oneway});
}

LanguageInfoParser::ParseResult LanguageInfoParser::ParseContent(
    std::string_view content) {
  blocks_.clear();
  in_block_ = false;
  error_.clear();
  data_ = LanguageMatchData();

  parser_ = XML_ParserCreate(nullptr);
  CHECK_NOT_NULL(parser_);
  auto free_parser = OnScopeLeave([this]() {
    XML_ParserFree(parser_);
    parser_ = nullptr;
  });

  XML_SetUserData(parser_, this);
  XML_SetElementHandler(parser_, StartElementHandler, EndElementHandler);

  if (XML_Parse(parser_,
                content.data(),
                static_cast<int>(content.size()),
                XML_TRUE) == XML_STATUS_ERROR) {
    if (error_.empty()) {
      error_ = SPrintF("line %u: %s",
                       XML_GetCurrentLineNumber(parser_),
                       XML_ErrorString(XML_GetErrorCode(parser_)));
    }
    per_process::Debug(DebugCategory::LANGUAGE_INFO,
                       "invalid language info: %s\n",
                       error_);
    return InvalidContent;
  }

  if (blocks_.empty()) {
    error_ = "no <languageMatches> element";
    return InvalidContent;
  }

  Block* chosen = &blocks_.front();
  for (Block& block : blocks_) {
    if (block.type == "written_new") {
      chosen = &block;
      break;
    }
  }
  data_ = std::move(chosen->data);
  blocks_.clear();

  per_process::Debug(DebugCategory::LANGUAGE_INFO,
                     "loaded %u paradigm locales, %u variables, %u rules\n",
                     data_.paradigm_locales.size(),
                     data_.variables.size(),
                     data_.rules.size());
  return Valid;
}

LanguageInfoParser::ParseResult LanguageInfoParser::ParsePath(
    const std::string& path) {
  std::string content;
  int r = ReadFileSync(&content, path.c_str());
  if (r != 0) {
    error_ = SPrintF("cannot read %s: %s", path, uv_strerror(r));
    per_process::Debug(DebugCategory::LANGUAGE_INFO, "%s\n", error_);
    return FileError;
  }
  return ParseContent(content);
}

}  // namespace langmatch
