#ifndef SRC_LANGUAGE_INFO_PARSER_H_
#define SRC_LANGUAGE_INFO_PARSER_H_

#include "language_match_data.h"

#include <expat.h>

#include <string>
#include <string_view>
#include <vector>

namespace langmatch {

// Reads the <languageMatching> section of CLDR's supplemental
// languageInfo.xml:
//
//   <languageMatches type="written_new">
//     <paradigmLocales locales="en en_GB es es_419 pt_BR pt_PT"/>
//     <matchVariable id="$enUS" value="AS+CA+GU+MH+MP+PH+PR+UM+US+VI"/>
//     <languageMatch desired="en_*_$!enUS" supported="en_*_GB" distance="3"/>
//     ...
//   </languageMatches>
//
// When the document has several <languageMatches> blocks the one with
// type="written_new" is used, otherwise the first one.
class LanguageInfoParser {
 public:
  enum ParseResult { Valid, FileError, InvalidContent };

  LanguageInfoParser() = default;
  LanguageInfoParser(const LanguageInfoParser&) = delete;
  LanguageInfoParser& operator=(const LanguageInfoParser&) = delete;

  ParseResult ParseContent(std::string_view content);
  ParseResult ParsePath(const std::string& path);

  // Only meaningful after a Valid result.
  const LanguageMatchData& data() const { return data_; }
  LanguageMatchData TakeData() { return std::move(data_); }

  // Describes the failure after a FileError or InvalidContent result.
  const std::string& error() const { return error_; }

 private:
  struct Block {
    std::string type;
    LanguageMatchData data;
  };

  static void XMLCALL StartElementHandler(void* user_data,
                                          const XML_Char* name,
                                          const XML_Char** atts);
  static void XMLCALL EndElementHandler(void* user_data, const XML_Char* name);

  void StartElement(std::string_view name, const XML_Char** atts);
  void EndElement(std::string_view name);

  void ParseParadigmLocales(const XML_Char** atts);
  void ParseMatchVariable(const XML_Char** atts);
  void ParseLanguageMatch(const XML_Char** atts);

  // Records the first error and stops the parser.
  void Fail(std::string message);

  XML_Parser parser_ = nullptr;
  std::vector<Block> blocks_;
  bool in_block_ = false;
  LanguageMatchData data_;
  std::string error_;
};

}  // namespace langmatch

#endif  // SRC_LANGUAGE_INFO_PARSER_H_
