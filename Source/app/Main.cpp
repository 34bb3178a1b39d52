#include "CommandLine.h"
#include "../phonemes/CmuDictPhonemizer.h"
#include "../phonemes/CommandPhonemizer.h"
#include "../playback/DevicePlaybackSink.h"
#include "../playback/SpeechThread.h"
#include "../render/Renderer.h"
#include "../utils/VersionInfo.h"
#include <juce_events/juce_events.h>
#include <iostream>
#include <memory>

using namespace Phonoclip;

namespace
{
    /** Installs a date-stamped file logger and puts the previous logger back on destruction. */
    class ScopedFileLogger
    {
    public:
        explicit ScopedFileLogger (const juce::String& requestedDir)
            : previous (juce::Logger::getCurrentLogger())
        {
            auto logDir = requestedDir.isNotEmpty()
                            ? juce::File::getCurrentWorkingDirectory().getChildFile (requestedDir)
                            : juce::File::getSpecialLocation (juce::File::userApplicationDataDirectory)
                                  .getChildFile (VersionInfo::getApplicationName())
                                  .getChildFile ("logs");

            if (logDir.createDirectory().failed())
                return;

            logger.reset (juce::FileLogger::createDateStampedLogger (logDir.getFullPathName(), "phonoclip", ".log",
                                                                      "[Phonoclip] " + VersionInfo::getBuildInfoString()));
            if (logger != nullptr)
                juce::Logger::setCurrentLogger (logger.get());
        }

        ~ScopedFileLogger()
        {
            juce::Logger::setCurrentLogger (previous);
        }

        juce::File getLogFile() const { return logger != nullptr ? logger->getLogFile() : juce::File(); }

    private:
        juce::Logger* previous;
        std::unique_ptr<juce::FileLogger> logger;
    };

    void printDiagnostics (const RenderResult& result)
    {
        for (const auto& d : result.diagnostics)
            std::cerr << "warning: " << d.toString() << std::endl;
    }

    std::unique_ptr<Phonemizer> createPhonemizer (const CommandLineOptions& options, juce::String& error)
    {
        if (options.g2pCommand.isNotEmpty())
            return std::make_unique<CommandPhonemizer> (options.g2pCommand);

        auto dict = std::make_unique<CmuDictPhonemizer>();
        auto file = juce::File::getCurrentWorkingDirectory().getChildFile (options.dictPath);

        if (! dict->loadFromFile (file, error))
            return nullptr;

        return dict;
    }

    int runRender (Renderer& renderer, const juce::File& voiceRoot, const SynthConfig& config,
                   const CommandLineOptions& options)
    {
        auto output = juce::File::getCurrentWorkingDirectory().getChildFile (options.outputPath);
        auto result = renderer.renderToFile (options.text, voiceRoot, config, output);
        printDiagnostics (result);

        if (result.wasRendered())
            std::cout << "Wrote " << output.getFullPathName() << " ("
                      << juce::String (result.audio.getDurationSeconds(), 2) << " s)" << std::endl;
        else
            std::cerr << "error: " << RenderResult::statusName (result.status)
                      << (result.errorMessage.isNotEmpty() ? ": " + result.errorMessage : juce::String()) << std::endl;

        return exitCodeFor (result.status);
    }

    int runSpeak (Renderer& renderer, const juce::File& voiceRoot, const SynthConfig& config,
                  const CommandLineOptions& options)
    {
        juce::ScopedJuceInitialiser_GUI juceInit;

        juce::WaitableEvent finished;
        RenderResult outcome;

        SpeechThread speech (renderer, voiceRoot, config,
                             [] { return std::make_unique<DevicePlaybackSink>(); });

        speech.setOnFinished ([&] (const juce::String&, const RenderResult& result)
        {
            outcome = result;
            finished.signal();
        });

        speech.startThread();
        speech.speak (options.text);
        finished.wait (-1);

        printDiagnostics (outcome);

        if (! outcome.wasRendered())
            std::cerr << "error: " << RenderResult::statusName (outcome.status)
                      << (outcome.errorMessage.isNotEmpty() ? ": " + outcome.errorMessage : juce::String()) << std::endl;

        return exitCodeFor (outcome.status);
    }
}

int main (int argc, char* argv[])
{
    juce::StringArray args;
    for (int i = 1; i < argc; ++i)
        args.add (juce::String::fromUTF8 (argv[i]));

    CommandLineOptions options;
    juce::String error;

    if (! CommandLineOptions::parse (args, options, error))
    {
        std::cerr << "error: " << error << "\n\n" << CommandLineOptions::getUsage();
        return exitUsageError;
    }

    if (options.command == CommandLineOptions::Command::Help)
    {
        std::cout << CommandLineOptions::getUsage();
        return exitOk;
    }

    if (options.command == CommandLineOptions::Command::Version)
    {
        std::cout << VersionInfo::getBuildInfoString() << std::endl;
        return exitOk;
    }

    ScopedFileLogger fileLogger (options.logDir);
    juce::Logger::writeToLog ("[Phonoclip] Log file: " + fileLogger.getLogFile().getFullPathName());

    SynthConfig config;
    SynthConfig::fromPresetName (options.getEffectivePresetName(), config);

    if (options.configPath.isNotEmpty()
        && ! config.applyJsonFile (juce::File::getCurrentWorkingDirectory().getChildFile (options.configPath), error))
    {
        std::cerr << "error: " << error << std::endl;
        juce::Logger::writeToLog ("[Phonoclip] Bad configuration: " + error);
        return exitUsageError;
    }

    auto voiceRoot = juce::File::getCurrentWorkingDirectory().getChildFile (options.voiceDir);
    if (! voiceRoot.isDirectory())
    {
        std::cerr << "error: voice directory not found: " << voiceRoot.getFullPathName() << std::endl;
        return exitUsageError;
    }

    auto phonemizer = createPhonemizer (options, error);
    if (phonemizer == nullptr)
    {
        std::cerr << "error: " << error << std::endl;
        juce::Logger::writeToLog ("[Phonoclip] " + error);
        return exitUsageError;
    }

    std::unique_ptr<RandomVariantSelector> selector;
    if (options.hasSeed)
        selector = std::make_unique<RandomVariantSelector> (options.seed);
    else
        selector = std::make_unique<RandomVariantSelector>();

    Renderer renderer (*phonemizer, *selector);

    if (options.command == CommandLineOptions::Command::Speak)
        return runSpeak (renderer, voiceRoot, config, options);

    return runRender (renderer, voiceRoot, config, options);
}
