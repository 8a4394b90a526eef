#include "dcx_match_result.h"
#include "../dcx_compare_exceptions.h"
#include <algorithm>
#include <tuple>

namespace {

  // Integer or null; anything else is a malformed entry
  int optional_index(const dcxv_map& values, const char* key) {
    dcxv_map::const_iterator it = values.find(key);
    if (it == values.end() || it->second.is_null()) {
      return dcx_no_page;
    }
    if (!it->second.is_int() || it->second.int_value() < 0) {
      throw dcx_invalid_session_error(dcx_string("'") + key + "' must be a non-negative integer or null");
    }
    return static_cast<int>(it->second.int_value());
  }

  dcxv_vector index_list(const std::set<int>& indices) {
    dcxv_vector list;
    for (int index : indices) {
      list.push_back(dcx_variant(index));
    }
    return list;
  }

  std::tuple<int, int, int> sort_key(const dcx_match_result& result) {
    if (result.left() != dcx_no_page) {
      return std::make_tuple(0, result.left(), result.right());
    }
    return std::make_tuple(1, result.right(), 0);
  }

}

// ============================================================================
// dcx_match_result
// ============================================================================

dcx_match_result dcx_match_result::make_matched(int left, int right, double similarity,
                                                int distance, bool manual)
{
  dcx_match_result result;
  result.left_index = left;
  result.right_index = right;
  result.status = status_to_string(matched);
  result.similarity = similarity;
  result.phash_distance = distance;
  result.is_manual = manual;
  return result;
}

dcx_match_result dcx_match_result::make_unmatched_left(int left, bool manual)
{
  dcx_match_result result;
  result.left_index = left;
  result.right_index.set_null();
  result.status = status_to_string(unmatched_left);
  result.similarity = 0.0;
  result.phash_distance = 0;
  result.is_manual = manual;
  return result;
}

dcx_match_result dcx_match_result::make_unmatched_right(int right, bool manual)
{
  dcx_match_result result;
  result.left_index.set_null();
  result.right_index = right;
  result.status = status_to_string(unmatched_right);
  result.similarity = 0.0;
  result.phash_distance = 0;
  result.is_manual = manual;
  return result;
}

dcx_match_result::status_type dcx_match_result::get_status() const
{
  return status_from_string(*status);
}

int dcx_match_result::left() const
{
  return left_index.is_null() ? dcx_no_page : static_cast<int>(*left_index);
}

int dcx_match_result::right() const
{
  return right_index.is_null() ? dcx_no_page : static_cast<int>(*right_index);
}

bool dcx_match_result::has_difference() const
{
  if (get_status() != matched) {
    return true;
  }
  return *similarity < 0.99;
}

void dcx_match_result::validate() const
{
  status_type s = get_status();
  bool has_left = left() != dcx_no_page;
  bool has_right = right() != dcx_no_page;

  if (s == matched && !(has_left && has_right)) {
    throw dcx_invalid_session_error("MATCHED result needs both page indices");
  }
  if (s == unmatched_left && !(has_left && !has_right)) {
    throw dcx_invalid_session_error("UNMATCHED_LEFT result needs only a left page index");
  }
  if (s == unmatched_right && !(!has_left && has_right)) {
    throw dcx_invalid_session_error("UNMATCHED_RIGHT result needs only a right page index");
  }
}

dcx_match_result dcx_match_result::from_map(const dcxv_map& values)
{
  dcxv_map::const_iterator it = values.find("status");
  if (it == values.end() || !it->second.is_string()) {
    throw dcx_invalid_session_error("Match entry has no status");
  }
  status_type s = status_from_string(it->second.string_value());

  double sim = 0.0;
  it = values.find("similarity");
  if (it != values.end() && !it->second.is_null()) {
    if (!(it->second.is_double() || it->second.is_int())) {
      throw dcx_invalid_session_error("'similarity' must be a number");
    }
    sim = it->second.convert(dcx_variant::double_state).double_value();
  }

  int distance = 0;
  it = values.find("phash_distance");
  if (it != values.end() && !it->second.is_null()) {
    if (!it->second.is_int()) {
      throw dcx_invalid_session_error("'phash_distance' must be an integer");
    }
    distance = static_cast<int>(it->second.int_value());
  }

  bool manual = false;
  it = values.find("is_manual");
  if (it != values.end() && !it->second.is_null()) {
    if (!it->second.is_bool()) {
      throw dcx_invalid_session_error("'is_manual' must be a boolean");
    }
    manual = it->second.bool_value();
  }

  dcx_match_result result;
  int left = optional_index(values, "left_index");
  int right = optional_index(values, "right_index");
  if (left == dcx_no_page) {
    result.left_index.set_null();
  } else {
    result.left_index = left;
  }
  if (right == dcx_no_page) {
    result.right_index.set_null();
  } else {
    result.right_index = right;
  }
  result.status = status_to_string(s);
  result.similarity = sim;
  result.phash_distance = distance;
  result.is_manual = manual;
  result.validate();
  return result;
}

dcx_string dcx_match_result::status_to_string(status_type s)
{
  switch (s) {
    case matched: return "matched";
    case unmatched_left: return "unmatched_left";
    case unmatched_right:
    default: return "unmatched_right";
  }
}

dcx_match_result::status_type dcx_match_result::status_from_string(const dcx_string& text)
{
  if (text == "matched") return matched;
  if (text == "unmatched_left") return unmatched_left;
  if (text == "unmatched_right") return unmatched_right;
  throw dcx_invalid_session_error("Unknown match status '" + text + "'");
}

// ============================================================================
// dcx_matching_result
// ============================================================================

void dcx_matching_result::index_result(const dcx_match_result& result)
{
  switch (result.get_status()) {
    case dcx_match_result::unmatched_left:
      left_unmatched_set.insert(result.left());
      break;
    case dcx_match_result::unmatched_right:
      right_unmatched_set.insert(result.right());
      break;
    case dcx_match_result::matched:
      left_unmatched_set.erase(result.left());
      right_unmatched_set.erase(result.right());
      break;
  }
}

void dcx_matching_result::unindex_result(const dcx_match_result& result)
{
  if (result.get_status() == dcx_match_result::unmatched_left) {
    left_unmatched_set.erase(result.left());
  } else if (result.get_status() == dcx_match_result::unmatched_right) {
    right_unmatched_set.erase(result.right());
  }
}

void dcx_matching_result::add(const dcx_match_result& result)
{
  result.validate();
  results.push_back(result);
  index_result(result);
}

void dcx_matching_result::sort_matches()
{
  std::stable_sort(results.begin(), results.end(),
                   [](const dcx_match_result& a, const dcx_match_result& b) {
                     return sort_key(a) < sort_key(b);
                   });
}

const dcx_match_result* dcx_matching_result::match_for_left(int left) const
{
  for (const dcx_match_result& result : results) {
    if (result.left() == left) {
      return &result;
    }
  }
  return nullptr;
}

const dcx_match_result* dcx_matching_result::match_for_right(int right) const
{
  for (const dcx_match_result& result : results) {
    if (result.right() == right) {
      return &result;
    }
  }
  return nullptr;
}

std::vector<dcx_matched_pair> dcx_matching_result::matched_pairs() const
{
  std::vector<dcx_matched_pair> pairs;
  for (const dcx_match_result& result : results) {
    if (result.is_matched()) {
      pairs.push_back(dcx_matched_pair{result.left(), result.right(), *result.similarity});
    }
  }
  return pairs;
}

size_t dcx_matching_result::matched_count() const
{
  return static_cast<size_t>(std::count_if(results.begin(), results.end(),
                                           [](const dcx_match_result& r) { return r.is_matched(); }));
}

size_t dcx_matching_result::difference_count() const
{
  return static_cast<size_t>(std::count_if(results.begin(), results.end(),
                                           [](const dcx_match_result& r) { return r.has_difference(); }));
}

void dcx_matching_result::set_manual_match(int left, int right)
{
  if (left == dcx_no_page && right == dcx_no_page) {
    throw std::invalid_argument("Manual match needs at least one page index");
  }

  std::vector<int> orphaned_left;
  std::vector<int> orphaned_right;
  std::vector<dcx_match_result> kept;
  for (const dcx_match_result& result : results) {
    bool touches = (left != dcx_no_page && result.left() == left) ||
                   (right != dcx_no_page && result.right() == right);
    if (!touches) {
      kept.push_back(result);
      continue;
    }
    unindex_result(result);
    if (result.left() != dcx_no_page && result.left() != left) {
      orphaned_left.push_back(result.left());
    }
    if (result.right() != dcx_no_page && result.right() != right) {
      orphaned_right.push_back(result.right());
    }
  }
  results.swap(kept);

  if (left != dcx_no_page && right != dcx_no_page) {
    add(dcx_match_result::make_matched(left, right, 1.0, 0, true));
  } else if (left != dcx_no_page) {
    add(dcx_match_result::make_unmatched_left(left, true));
  } else {
    add(dcx_match_result::make_unmatched_right(right, true));
  }

  for (int index : orphaned_left) {
    add(dcx_match_result::make_unmatched_left(index));
  }
  for (int index : orphaned_right) {
    add(dcx_match_result::make_unmatched_right(index));
  }
  sort_matches();
}

bool dcx_matching_result::remove_manual_match(int left, int right)
{
  for (size_t i = 0; i < results.size(); ++i) {
    const dcx_match_result& result = results[i];
    if (result.left() != left || result.right() != right || !*result.is_manual) {
      continue;
    }

    unindex_result(result);
    results.erase(results.begin() + static_cast<std::ptrdiff_t>(i));
    if (left != dcx_no_page) {
      add(dcx_match_result::make_unmatched_left(left));
    }
    if (right != dcx_no_page) {
      add(dcx_match_result::make_unmatched_right(right));
    }
    sort_matches();
    return true;
  }
  return false;
}

bool dcx_matching_result::update_similarity(int left, int right, double similarity)
{
  for (dcx_match_result& result : results) {
    if (result.is_matched() && result.left() == left && result.right() == right) {
      result.similarity = similarity;
      return true;
    }
  }
  return false;
}

dcxv_map dcx_matching_result::to_map() const
{
  dcxv_vector list;
  for (const dcx_match_result& result : results) {
    list.push_back(result.to_map());
  }

  dcxv_map out;
  out["matches"] = list;
  out["left_unmatched"] = index_list(left_unmatched_set);
  out["right_unmatched"] = index_list(right_unmatched_set);
  return out;
}

dcx_matching_result dcx_matching_result::from_map(const dcxv_map& values)
{
  dcx_matching_result matching;
  dcxv_map::const_iterator it = values.find("matches");
  if (it == values.end() || !it->second.is_vector()) {
    throw dcx_invalid_session_error("Matching result needs a 'matches' list");
  }

  std::set<int> seen_left;
  std::set<int> seen_right;
  for (const dcx_variant& entry : it->second.vector_value()) {
    if (!entry.is_map()) {
      throw dcx_invalid_session_error("Match entry must be an object");
    }
    dcx_match_result result = dcx_match_result::from_map(entry.map_value());
    if (result.left() != dcx_no_page && !seen_left.insert(result.left()).second) {
      throw dcx_invalid_session_error("Left page " + dcx_string(result.left()) + " appears in more than one match");
    }
    if (result.right() != dcx_no_page && !seen_right.insert(result.right()).second) {
      throw dcx_invalid_session_error("Right page " + dcx_string(result.right()) + " appears in more than one match");
    }
    matching.add(result);
  }
  matching.sort_matches();
  return matching;
}

bool dcx_matching_result::operator==(const dcx_matching_result& other) const
{
  if (results.size() != other.results.size() ||
      left_unmatched_set != other.left_unmatched_set ||
      right_unmatched_set != other.right_unmatched_set) {
    return false;
  }
  for (size_t i = 0; i < results.size(); ++i) {
    const dcx_match_result& a = results[i];
    const dcx_match_result& b = other.results[i];
    if (a.left() != b.left() || a.right() != b.right() ||
        a.get_status() != b.get_status() ||
        *a.similarity != *b.similarity ||
        *a.phash_distance != *b.phash_distance ||
        *a.is_manual != *b.is_manual) {
      return false;
    }
  }
  return true;
}
