#include "signature_cache.h"
#include "jni_logger.h"
#include <algorithm>

std::string SignatureCache::getOrCompute(const std::string& className) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto it = entries_.find(className);
	if (it != entries_.end()) {
		return it->second;
	}
	std::string fragment = objectSignature(className);
	entries_.emplace(className, fragment);
	JNISIG_LOG_DEBUG("Cached signature %s for %s", fragment.c_str(), className.c_str());
	return fragment;
}

void SignatureCache::clear() {
	std::lock_guard<std::mutex> lock(mutex_);
	entries_.clear();
}

size_t SignatureCache::size() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return entries_.size();
}

SignatureCache& SignatureCache::shared() {
	static SignatureCache instance;
	return instance;
}

std::string SignatureCache::objectSignature(const std::string& className) {
	std::string fragment;
	fragment.reserve(className.size() + 2);
	fragment += 'L';
	fragment += className;
	std::replace(fragment.begin(), fragment.end(), '.', '/');
	fragment += ';';
	return fragment;
}
