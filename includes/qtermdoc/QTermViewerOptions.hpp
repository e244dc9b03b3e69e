/**
 * This file is a part of qtermdoc Project.
 * qtermdoc renders document pages inside a terminal
 * Copyright 2021-2022 Britanicus <marcusbritanicus@gmail.com>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * at your option, any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston,
 * MA 02110-1301, USA.
 **/

#pragma once

#include <QtCore>

#include <qtermdoc/QTermRenderOptions.hpp>
#include <qtermdoc/QTermViewport.hpp>
#include <qtermdoc/QTermTextEngine.hpp>

/**
 * Every knob of a viewing session.
 * Values come from the defaults below, optionally overridden by a QSettings
 * file and the command line, and are always passed through normalize().
 */
class QTermViewerOptions {
    public:
        enum ViewMode {
            ImageView,
            TextView
        };

        enum Quality {
            Fast,
            Balanced,
            Sharp
        };

        QTermViewerOptions();

        /* Entries of the page bitmap cache */
        int cacheCapacity = 4;

        /* Render and transmission budgets, zoom range */
        QTermViewportLimits limits;

        /* Text structuring heuristics */
        QTermTextOptions text;

        /* Worker threads for rasterization and text structuring */
        int workerThreads = 2;

        /* Run tasks inline on the calling thread (scripting, tests) */
        bool synchronous = false;

        ViewMode viewMode = ImageView;
        QTermTextEngine::TextMode textMode = QTermTextEngine::Reflow;
        Quality quality = Balanced;
        QTermRenderOptions::ColorMode colorMode = QTermRenderOptions::Color;

        int zoomPercent = 100;

        /* Reload the document when the file changes */
        bool watchFile = true;

        /* Set the render/transmit budgets of @preset */
        void applyQuality( Quality preset );

        /* Clamp everything into a usable range */
        void normalize();

        static QTermViewerOptions fromSettings( QSettings& settings );

        static QString qualityName( Quality preset );
        static Quality qualityFromName( QString name, Quality fallback );

        static QString viewModeName( ViewMode mode );
        static ViewMode viewModeFromName( QString name, ViewMode fallback );
};
