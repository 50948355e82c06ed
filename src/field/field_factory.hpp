//
// Created by ppwang on 2022/9/16.
//

#ifndef NGP_FIELDS__FIELD_FACTORY_HPP_
#define NGP_FIELDS__FIELD_FACTORY_HPP_

#include "ngp_net.hpp"
#include "ngp_radiance_field.hpp"

#include <yaml-cpp/yaml.h>

#include <memory>

// Both read an optional top level "seed" and their own section
// ("radiance_field" / "net") of the runtime config.
std::shared_ptr<NGPRadianceField> construct_radiance_field(const YAML::Node & root);
std::shared_ptr<NGPNet> construct_net(const YAML::Node & root);

#endif  // NGP_FIELDS__FIELD_FACTORY_HPP_
