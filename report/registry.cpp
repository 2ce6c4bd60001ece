/*
 * Filename: registry.cpp
 * Developer: Benjamin Cance
 * Date: 10/19/2026
 * 
 * Copyright 2026 Open Quant Desk, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "report/registry.hpp"
#include <cstddef>
#include <mutex>
#include <utility>

namespace report {

FunctionRendererFactory::FunctionRendererFactory(std::string name,
                                                 std::function<std::unique_ptr<IReportRenderer>()> create)
    : name_(std::move(name)), create_(std::move(create)) {}

std::unique_ptr<IReportRenderer> FunctionRendererFactory::createRenderer() {
    return create_ ? create_() : nullptr;
}

void RendererRegistry::registerRenderer(std::unique_ptr<IRendererFactory> factory) {
    std::unique_lock<std::shared_mutex> lock(factoriesLock_);
    std::string name = factory->getName();
    factories_[name] = std::move(factory);
}

void RendererRegistry::unregisterRenderer(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(factoriesLock_);
    factories_.erase(name);
}

std::vector<std::string> RendererRegistry::getAvailableRenderers() const {
    std::shared_lock<std::shared_mutex> lock(factoriesLock_);
    std::vector<std::string> renderers;
    renderers.reserve(factories_.size());

    for (const auto& [name, factory] : factories_) {
        if (factory->isAvailable()) {
            renderers.push_back(name);
        }
    }

    return renderers;
}

bool RendererRegistry::isRegistered(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(factoriesLock_);
    return factories_.find(name) != factories_.end();
}

common::Result<std::unique_ptr<IReportRenderer>> RendererRegistry::create(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(factoriesLock_);

    auto it = factories_.find(name);
    if (it == factories_.end() || !it->second->isAvailable()) {
        return common::makeError<std::unique_ptr<IReportRenderer>>(
            common::ErrorKind::DependencyUnavailable, "no renderer available for '" + name + "'");
    }

    auto renderer = it->second->createRenderer();
    if (!renderer) {
        return common::makeError<std::unique_ptr<IReportRenderer>>(
            common::ErrorKind::DependencyUnavailable, "renderer '" + name + "' could not be created");
    }
    return common::makeSuccess(std::move(renderer));
}

CompositeRenderer::CompositeRenderer(std::vector<std::unique_ptr<IReportRenderer>> parts)
    : parts_(std::move(parts)) {}

std::string CompositeRenderer::getName() const {
    std::string name;
    for (const auto& part : parts_) {
        if (!name.empty()) {
            name += "+";
        }
        name += part->getName();
    }
    return name;
}

std::vector<std::string> CompositeRenderer::getOutputExtensions() const {
    std::vector<std::string> extensions;
    for (const auto& part : parts_) {
        for (const auto& extension : part->getOutputExtensions()) {
            extensions.push_back(extension);
        }
    }
    return extensions;
}

common::Status CompositeRenderer::render(const ReportPayload& payload, const RenderTargets& targets) {
    std::size_t offset = 0;
    for (const auto& part : parts_) {
        const std::size_t count = part->getOutputExtensions().size();
        if (offset + count > targets.size()) {
            return common::fail(common::ErrorKind::Validation,
                                "not enough output paths for renderer '" + part->getName() + "'");
        }

        RenderTargets partTargets(targets.begin() + static_cast<std::ptrdiff_t>(offset),
                                  targets.begin() + static_cast<std::ptrdiff_t>(offset + count));
        auto status = part->render(payload, partTargets);
        if (!common::isSuccess(status)) {
            return status;
        }
        offset += count;
    }
    return common::ok();
}

}
