/*
 * Filename: registry.hpp
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

#pragma once

#include "interfaces/renderer.hpp"
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace report {

// Renderer factory built from a name and a creation function.
class FunctionRendererFactory : public IRendererFactory {
private:
    std::string name_;
    std::function<std::unique_ptr<IReportRenderer>()> create_;

public:
    FunctionRendererFactory(std::string name, std::function<std::unique_ptr<IReportRenderer>()> create);

    std::unique_ptr<IReportRenderer> createRenderer() override;
    std::string getName() const override { return name_; }
};

class RendererRegistry {
private:
    std::map<std::string, std::unique_ptr<IRendererFactory>> factories_;
    mutable std::shared_mutex factoriesLock_;

public:
    RendererRegistry() = default;
    ~RendererRegistry() = default;

    RendererRegistry(const RendererRegistry&) = delete;
    RendererRegistry& operator=(const RendererRegistry&) = delete;

    void registerRenderer(std::unique_ptr<IRendererFactory> factory);
    void unregisterRenderer(const std::string& name);

    std::vector<std::string> getAvailableRenderers() const;
    bool isRegistered(const std::string& name) const;

    // DependencyUnavailable when no factory is registered under `name` or the
    // factory reports its backend as unavailable.
    common::Result<std::unique_ptr<IReportRenderer>> create(const std::string& name) const;
};

// Renders the same payload through several renderers, each to its own
// targets. Stops at the first failure.
class CompositeRenderer : public IReportRenderer {
private:
    std::vector<std::unique_ptr<IReportRenderer>> parts_;

public:
    explicit CompositeRenderer(std::vector<std::unique_ptr<IReportRenderer>> parts);

    std::string getName() const override;
    std::vector<std::string> getOutputExtensions() const override;
    common::Status render(const ReportPayload& payload, const RenderTargets& targets) override;
};

}
