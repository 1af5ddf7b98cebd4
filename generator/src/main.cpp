// 程序入口：phasegen 命令行

#include "app/GenerationJob.h"
#include "source/JsonActivationSource.h"

#include <QCoreApplication>
#include <QCommandLineParser>
#include <QJsonDocument>
#include <QTextStream>

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);

    // 设置应用程序信息
    app.setApplicationName("phasegen");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("TiZiTeam");

    QCommandLineParser parser;
    parser.setApplicationDescription("Generate Rockwell ladder and Siemens SCL code from phase step activations");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption inputOpt(QStringList{"i", "input"}, "Activation JSON file.", "file");
    QCommandLineOption configOpt(QStringList{"c", "config"}, "Mapping configuration file.", "file",
                                 "plc_config.json");
    QCommandLineOption outputOpt(QStringList{"o", "output"}, "Output directory.", "dir", "output");
    QCommandLineOption controllerOpt("controller", "rockwell, siemens or all.", "type", "all");
    QCommandLineOption phaseOpt("phase", "Only this phase instance.", "id");
    QCommandLineOption routineOpt("routine", "L5X routine name.", "name", "CM_Valve");
    QCommandLineOption programOpt("program", "L5X program name.", "name",
                                  "Phase01001_SEQ_DF_Master");
    QCommandLineOption previewOpt("preview", "Print the resolved activations as JSON.");
    QCommandLineOption showConfigOpt("show-config", "Print the mapping tables.");
    parser.addOptions({inputOpt, configOpt, outputOpt, controllerOpt, phaseOpt,
                       routineOpt, programOpt, previewOpt, showConfigOpt});
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    GenerationJob job;
    QObject::connect(&job, &GenerationJob::logMessage, [&err](const QString& msg) {
        err << "[ Generate ] " << msg << Qt::endl;
    });

    job.loadConfig(parser.value(configOpt));

    if (parser.isSet(showConfigOpt)) {
        out << job.describeConfig() << Qt::endl;
        if (!parser.isSet(inputOpt))
            return 0;
    }

    if (!parser.isSet(inputOpt)) {
        err << "[ Generate ] Error: no input file given (-i)" << Qt::endl;
        return 1;
    }

    int phaseId = -1;
    if (parser.isSet(phaseOpt)) {
        bool ok = false;
        phaseId = parser.value(phaseOpt).toInt(&ok);
        if (!ok || phaseId < 0) {
            err << "[ Generate ] Error: invalid phase instance id \""
                << parser.value(phaseOpt) << "\"" << Qt::endl;
            return 1;
        }
    }

    JsonActivationSource source(parser.value(inputOpt));

    if (parser.isSet(previewOpt)) {
        const QJsonObject preview = job.preview(&source, phaseId);
        if (preview.isEmpty())
            return 1;
        out << QJsonDocument(preview).toJson(QJsonDocument::Indented);
        out.flush();
        return 0;
    }

    GenerationRequest request;
    request.outputDir       = parser.value(outputOpt);
    request.controller      = parser.value(controllerOpt).toLower();
    request.phaseInstanceId = phaseId;
    request.routineName     = parser.value(routineOpt);
    request.programName     = parser.value(programOpt);

    return job.run(&source, request) ? 0 : 1;
}
