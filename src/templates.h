#ifndef TEMPLATES_H_INCLUDED
#define TEMPLATES_H_INCLUDED

#include <memory>
#include <string>

#include <rapidjson/document.h>
#include <yaml-cpp/yaml.h>

#include "rapidjson_extra.h"

typedef std::shared_ptr<const rapidjson::Document> template_ptr;

extern const char *default_clash_template;
extern const char *default_singbox_template;

// both getters hand out the same immutable document until a reload
template_ptr getClashTemplate();
template_ptr getSingboxTemplate();

int loadClashTemplate(const std::string &content);
int loadSingboxTemplate(const std::string &content);
// empty path keeps the built-in template
void loadTemplateFiles(const std::string &clash_path,
                       const std::string &singbox_path);

void yamlToJson(const YAML::Node &node, rapidjson::Value &json,
                json_allocator &allocator);

#endif // TEMPLATES_H_INCLUDED
