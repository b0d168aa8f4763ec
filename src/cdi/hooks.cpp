#include "hooks.hpp"
#include "../log.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/filereadstream.h>

#include <cerrno>
#include <cstdio>
#include <memory>

namespace cdihook {

namespace {

using FilePtr = std::unique_ptr<FILE, decltype(&fclose)>;

std::optional<Error> parse_json_file(const std::string& path, const char* what,
                                     rapidjson::Document& doc) {
    FilePtr fp(fopen(path.c_str(), "re"), &fclose);
    if (!fp) {
        return make_errno_error(std::string("Failed opening the ") + what, path, errno);
    }

    char buf[16384];
    rapidjson::FileReadStream stream(fp.get(), buf, sizeof(buf));
    // Only the first JSON value is decoded, trailing content is ignored.
    doc.ParseStream<rapidjson::kParseStopWhenDoneFlag>(stream);

    if (ferror(fp.get())) {
        return make_error(ErrorKind::IOError, std::string("Failed reading the ") + what, path,
                          errno != 0 ? errno : EIO);
    }
    if (doc.HasParseError()) {
        return make_error(ErrorKind::DecodeError,
                          std::string("Failed decoding the ") + what + ": " +
                              rapidjson::GetParseError_En(doc.GetParseError()) + " (offset " +
                              std::to_string(doc.GetErrorOffset()) + ")",
                          path);
    }
    if (!doc.IsObject()) {
        return make_error(ErrorKind::DecodeError,
                          std::string("Failed decoding the ") + what + ": expected a JSON object",
                          path);
    }

    return std::nullopt;
}

Error type_error(const std::string& path, const char* what, const std::string& field,
                 const char* expected) {
    return make_error(ErrorKind::DecodeError,
                      std::string("Failed decoding the ") + what + ": \"" + field +
                          "\" must be " + expected,
                      path);
}

// Absent and null members decode to an empty string.
bool read_string(const rapidjson::Value& obj, const char* name, std::string& out) {
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd() || it->value.IsNull()) {
        out.clear();
        return true;
    }
    if (!it->value.IsString())
        return false;
    out.assign(it->value.GetString(), it->value.GetStringLength());
    return true;
}

// Absent and null members decode to an empty array; nullptr if the type is wrong.
const rapidjson::Value* find_array(const rapidjson::Value& obj, const char* name, bool& ok) {
    static const rapidjson::Value empty(rapidjson::kArrayType);
    ok = true;
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd() || it->value.IsNull())
        return &empty;
    if (!it->value.IsArray()) {
        ok = false;
        return nullptr;
    }
    return &it->value;
}

std::optional<Error> decode_string_maps(const std::string& path, const rapidjson::Value& obj,
                                        const char* name,
                                        std::vector<std::map<std::string, std::string>>& out) {
    const char* what = "CDI config devices file";
    bool ok;
    const rapidjson::Value* arr = find_array(obj, name, ok);
    if (!ok)
        return type_error(path, what, name, "an array");

    for (rapidjson::SizeType i = 0; i < arr->Size(); i++) {
        const rapidjson::Value& item = (*arr)[i];
        std::string field = std::string(name) + "[" + std::to_string(i) + "]";
        if (item.IsNull()) {
            out.emplace_back();
            continue;
        }
        if (!item.IsObject())
            return type_error(path, what, field, "an object");

        std::map<std::string, std::string> entry;
        for (auto m = item.MemberBegin(); m != item.MemberEnd(); ++m) {
            std::string key(m->name.GetString(), m->name.GetStringLength());
            if (!m->value.IsString())
                return type_error(path, what, field + "." + key, "a string");
            entry[key].assign(m->value.GetString(), m->value.GetStringLength());
        }
        out.push_back(std::move(entry));
    }

    return std::nullopt;
}

}  // namespace

std::optional<Error> load_hook_plan(const std::string& path, HookPlan& out) {
    const char* what = "CDI hooks file";
    rapidjson::Document doc;
    if (auto err = parse_json_file(path, what, doc))
        return err;

    HookPlan plan;
    if (!read_string(doc, "container_rootfs", plan.container_rootfs))
        return type_error(path, what, "container_rootfs", "a string");

    bool ok;
    const rapidjson::Value* updates = find_array(doc, "ld_cache_updates", ok);
    if (!ok)
        return type_error(path, what, "ld_cache_updates", "an array");
    for (rapidjson::SizeType i = 0; i < updates->Size(); i++) {
        const rapidjson::Value& item = (*updates)[i];
        if (item.IsNull()) {
            plan.ld_cache_updates.emplace_back();
        } else if (item.IsString()) {
            plan.ld_cache_updates.emplace_back(item.GetString(), item.GetStringLength());
        } else {
            return type_error(path, what, "ld_cache_updates[" + std::to_string(i) + "]",
                              "a string");
        }
    }

    const rapidjson::Value* symlinks = find_array(doc, "symlinks", ok);
    if (!ok)
        return type_error(path, what, "symlinks", "an array");
    for (rapidjson::SizeType i = 0; i < symlinks->Size(); i++) {
        const rapidjson::Value& item = (*symlinks)[i];
        std::string field = "symlinks[" + std::to_string(i) + "]";
        SymlinkEntry entry;
        if (!item.IsNull()) {
            if (!item.IsObject())
                return type_error(path, what, field, "an object");
            if (!read_string(item, "target", entry.target))
                return type_error(path, what, field + ".target", "a string");
            if (!read_string(item, "link", entry.link))
                return type_error(path, what, field + ".link", "a string");
        }
        plan.symlinks.push_back(std::move(entry));
    }

    LOGD("Loaded %s: %zu symlinks, %zu ld cache updates", path.c_str(), plan.symlinks.size(),
         plan.ld_cache_updates.size());
    out = std::move(plan);
    return std::nullopt;
}

std::optional<Error> load_config_devices(const std::string& path, ConfigDevices& out) {
    rapidjson::Document doc;
    if (auto err = parse_json_file(path, "CDI config devices file", doc))
        return err;

    ConfigDevices devices;
    if (auto err = decode_string_maps(path, doc, "unix_char_devs", devices.unix_char_devs))
        return err;
    if (auto err = decode_string_maps(path, doc, "bind_mounts", devices.bind_mounts))
        return err;

    out = std::move(devices);
    return std::nullopt;
}

std::string hooks_file_name(const HookConfig& config, const std::string& device_name) {
    return device_name + config.hooks_file_suffix;
}

std::string config_devices_file_name(const HookConfig& config, const std::string& device_name) {
    return device_name + config.config_devices_file_suffix;
}

}  // namespace cdihook
