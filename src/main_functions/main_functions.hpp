#ifndef NGP_FIELDS__MAIN_FUNCTIONS_HPP_
#define NGP_FIELDS__MAIN_FUNCTIONS_HPP_

#include <string>

void query_fields(const std::string & config_path);
void render_slice(const std::string & config_path);

#endif  // NGP_FIELDS__MAIN_FUNCTIONS_HPP_
