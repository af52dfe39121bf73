#pragma once
#include "addr/Lexicon.hpp"
#include "listing/ListingExtractor.hpp"
#include "listing/TitleRecord.hpp"

#include <istream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Reads {"building_suffixes": [...], "sale_keywords": [...], "province_aliases": {...}}
// into lex. Every key is optional; throws std::runtime_error on bad files or types.
void loadLexiconOverrides(const std::string& path, addr::Lexicon& lex);
void applyLexiconOverrides(const nlohmann::json& j, addr::Lexicon& lex);

// .jsonl: one object (or string) per line; .json: array of objects or strings;
// anything else: one title per line. Throws std::runtime_error.
std::vector<listing::TitleRecord> loadTitleRecords(const std::string& path);
std::vector<listing::TitleRecord> parseTitleLines(std::istream& in);
std::vector<listing::TitleRecord> parseTitleJsonl(std::istream& in);
std::vector<listing::TitleRecord> parseTitleJson(const nlohmann::json& root);

// source fields plus title/address/city/district/building/sale_content/purpose
nlohmann::json listingRecordToJson(const listing::TitleRecord& rec, const listing::ListingFields& f);
