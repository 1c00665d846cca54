#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>

#include "miniz.h"
#include "cJSON.h"

#include "firmware_package.hpp"
#include "error.hpp"
#include "debug.hpp"

namespace fs = std::filesystem;

static std::string to_lower(std::string s) {
	std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
	return s;
}

class DirectoryArchive : public PackageArchive {
private:
	fs::path m_dir;

public:
	DirectoryArchive(const std::string& dir) : m_dir(dir) {}

	std::vector<std::string> list() override {
		std::vector<std::string> names;
		std::error_code ec;
		for (auto const &entry : fs::directory_iterator(m_dir, ec))
			if (entry.is_regular_file())
				names.push_back(entry.path().filename().string());
		std::sort(names.begin(), names.end());
		return names;
	}

	ByteArray read(const std::string& name) override {
		std::ifstream file(m_dir / name, std::ios::binary);
		if (!file) {
			DEBUG_ERROR("DirectoryArchive: can't open %s", name.c_str());
			throw ErrorCode::FIRMWARE_PACKAGE_NOT_FOUND;
		}
		return ByteArray(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
	}
};

class ZipArchive : public PackageArchive {
private:
	mz_zip_archive m_zip;

public:
	ZipArchive(const std::string& path) {
		std::memset(&m_zip, 0, sizeof(m_zip));
		if (!mz_zip_reader_init_file(&m_zip, path.c_str(), 0)) {
			DEBUG_ERROR("ZipArchive: %s is not a zip archive (%s)", path.c_str(),
					mz_zip_get_error_string(mz_zip_get_last_error(&m_zip)));
			throw ErrorCode::FIRMWARE_PACKAGE_INVALID;
		}
	}

	~ZipArchive() {
		mz_zip_reader_end(&m_zip);
	}

	std::vector<std::string> list() override {
		std::vector<std::string> names;
		char name[256];
		mz_uint n = mz_zip_reader_get_num_files(&m_zip);
		for (mz_uint i = 0; i < n; i++) {
			if (mz_zip_reader_is_file_a_directory(&m_zip, i))
				continue;
			if (mz_zip_reader_get_filename(&m_zip, i, name, sizeof(name)))
				names.push_back(name);
		}
		return names;
	}

	ByteArray read(const std::string& name) override {
		int index = mz_zip_reader_locate_file(&m_zip, name.c_str(), nullptr, 0);
		if (index < 0) {
			DEBUG_ERROR("ZipArchive: %s not in archive", name.c_str());
			throw ErrorCode::FIRMWARE_PACKAGE_NOT_FOUND;
		}

		mz_zip_archive_file_stat stat;
		if (!mz_zip_reader_file_stat(&m_zip, index, &stat)) {
			DEBUG_ERROR("ZipArchive: can't stat %s", name.c_str());
			throw ErrorCode::FIRMWARE_PACKAGE_INVALID;
		}

		ByteArray data(static_cast<size_t>(stat.m_uncomp_size));
		if (!data.empty() && !mz_zip_reader_extract_to_mem(&m_zip, index, data.data(), data.size(), 0)) {
			DEBUG_ERROR("ZipArchive: can't extract %s", name.c_str());
			throw ErrorCode::FIRMWARE_PACKAGE_INVALID;
		}
		return data;
	}
};

ByteArray FirmwarePackageLoader::read_file(const std::string& path) {
	std::ifstream file(path, std::ios::binary);
	if (!file) {
		DEBUG_ERROR("FirmwarePackageLoader: can't open %s", path.c_str());
		throw ErrorCode::FIRMWARE_PACKAGE_NOT_FOUND;
	}
	return ByteArray(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

// Expects { "manifest": { "application": { "bin_file": ..., "dat_file": ... } } }
bool FirmwarePackageLoader::parse_manifest(const ByteArray& json, std::string& bin_file, std::string& dat_file) {
	std::string text(json.begin(), json.end());
	cJSON *root = cJSON_Parse(text.c_str());
	if (!root) {
		DEBUG_ERROR("FirmwarePackageLoader: can't parse %s", MANIFEST);
		return false;
	}

	cJSON *manifest = cJSON_GetObjectItem(root, "manifest");
	cJSON *application = manifest ? cJSON_GetObjectItem(manifest, "application") : nullptr;
	cJSON *bin = application ? cJSON_GetObjectItem(application, "bin_file") : nullptr;
	cJSON *dat = application ? cJSON_GetObjectItem(application, "dat_file") : nullptr;

	bool ok = cJSON_IsString(bin) && cJSON_IsString(dat);
	if (ok) {
		bin_file = bin->valuestring;
		dat_file = dat->valuestring;
	} else {
		DEBUG_ERROR("FirmwarePackageLoader: %s has no application firmware", MANIFEST);
	}

	cJSON_Delete(root);
	return ok;
}

std::string FirmwarePackageLoader::find_application_file(const std::vector<std::string>& names, const std::string& extension) {
	for (auto const &name : names) {
		std::string lower = to_lower(name);
		if (lower.size() > extension.size() &&
			lower.compare(lower.size() - extension.size(), extension.size(), extension) == 0 &&
			lower.find("application") != std::string::npos)
			return name;
	}
	return std::string();
}

FirmwarePackage FirmwarePackageLoader::load_archive(PackageArchive& archive, const std::string& path) {
	std::vector<std::string> names = archive.list();
	std::string bin_file, dat_file;

	if (std::find(names.begin(), names.end(), MANIFEST) != names.end()) {
		if (!parse_manifest(archive.read(MANIFEST), bin_file, dat_file))
			throw ErrorCode::FIRMWARE_PACKAGE_INVALID;
	} else {
		DEBUG_INFO("FirmwarePackageLoader: no %s in %s, looking for application files", MANIFEST, path.c_str());
		bin_file = find_application_file(names, ".bin");
		dat_file = find_application_file(names, ".dat");
		if (bin_file.empty() || dat_file.empty()) {
			DEBUG_ERROR("FirmwarePackageLoader: no application image and init packet in %s", path.c_str());
			throw ErrorCode::FIRMWARE_PACKAGE_NOT_FOUND;
		}
	}

	FirmwarePackage package;
	package.image = archive.read(bin_file);
	package.init_data = archive.read(dat_file);

	DEBUG_INFO("FirmwarePackageLoader: image %s (%zu bytes), init packet %s (%zu bytes)",
			bin_file.c_str(), package.image.size(), dat_file.c_str(), package.init_data.size());

	return package;
}

FirmwarePackage FirmwarePackageLoader::load(const std::string& path) {
	FirmwarePackage package;
	std::error_code ec;

	if (fs::is_directory(path, ec)) {
		DirectoryArchive archive(path);
		package = load_archive(archive, path);
	} else if (fs::is_regular_file(path, ec) && to_lower(fs::path(path).extension().string()) == ".zip") {
		ZipArchive archive(path);
		package = load_archive(archive, path);
	} else {
		std::string init_path = fs::path(path).replace_extension(".dat").string();
		if (!fs::is_regular_file(path, ec) || !fs::is_regular_file(init_path, ec)) {
			DEBUG_ERROR("FirmwarePackageLoader: no application image and init packet at %s", path.c_str());
			throw ErrorCode::FIRMWARE_PACKAGE_NOT_FOUND;
		}
		package.image = read_file(path);
		package.init_data = read_file(init_path);
		DEBUG_INFO("FirmwarePackageLoader: image %s (%zu bytes), init packet %s (%zu bytes)",
				path.c_str(), package.image.size(), init_path.c_str(), package.init_data.size());
	}

	if (package.image.empty()) {
		DEBUG_ERROR("FirmwarePackageLoader: image in %s is empty", path.c_str());
		throw ErrorCode::FIRMWARE_PACKAGE_INVALID;
	}

	return package;
}
